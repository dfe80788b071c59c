#pragma once

#include "mat2nwb/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mat2nwb {

// Minimal MAT-file Level 5 reader (MATLAB v5/v6/v7 "-v7" files).
// - 128-byte header; both byte orders ("IM" little-endian, "MI" big-endian)
// - data element tags, including the packed small-element format
// - miCOMPRESSED variables (zlib), as written by MATLAB's default save
// - miMATRIX arrays: numeric classes (converted to double), logical, char,
//   struct, object (parsed like struct), cell
// - complex arrays keep the real part only
// - sparse matrices, function handles and opaque objects are recorded with
//   their class and size; their payload is skipped
//
// Every top-level variable becomes one ChannelRecord, in file order.
// Malformed or truncated files throw LoadError.
class Mat5Reader {
public:
  RecordSet read(const std::string& path);

  // Parse an in-memory MAT v5 image (header included). `label` is used in
  // error messages.
  RecordSet parse(const std::vector<std::uint8_t>& bytes, const std::string& label);
};

} // namespace mat2nwb
