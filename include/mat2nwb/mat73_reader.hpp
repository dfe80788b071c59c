#pragma once

#include "mat2nwb/types.hpp"

#include <string>

namespace mat2nwb {

// MAT-file v7.3 reader (MATLAB "-v7.3" files are HDF5 files with a 512-byte
// userblock).
//
// Mapping:
// - root links are top-level variables; links starting with '#' ("#refs#",
//   "#subsystem#") are internal and skipped
// - datasets carry a MATLAB_class attribute ("double", "char", "cell", ...);
//   MATLAB dimensions are the HDF5 dimensions reversed
// - groups are structs; MATLAB_fields (when present) gives the field order
// - MATLAB_empty marks an empty array whose payload holds its size
// - cells are object references (usually into "#refs#")
// - complex data is a compound {real, imag}; only the real part is kept
//
// Plain HDF5 files without MATLAB attributes are read best-effort with the
// class inferred from the stored type.
class Mat73Reader {
public:
  RecordSet read(const std::string& path);
};

} // namespace mat2nwb
