#pragma once

#include "mat2nwb/types.hpp"

#include <string>

namespace mat2nwb {

enum class MatFormat {
  kV5,   // MAT-file Level 5 (v5, v6, v7)
  kV73,  // HDF5-based v7.3
};

const char* mat_format_name(MatFormat f);

// Inspect the 128-byte header (and the HDF5 signature) of `path`.
//
// Throws LoadError if the file cannot be opened or is neither format.
MatFormat detect_mat_format(const std::string& path);

// Read a MAT-file of either format:
// - header version 0x0100 => Mat5Reader
// - header version 0x0200, or any HDF5 file => Mat73Reader
//
// Returns the top-level variables in discovery order. Throws LoadError if the
// file is unreadable or malformed, or if it contains no variables.
RecordSet read_mat_file_auto(const std::string& path);

} // namespace mat2nwb
