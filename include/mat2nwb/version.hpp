#pragma once

#include <string>

namespace mat2nwb {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines MAT2NWB_VERSION_STRING for all targets that link against the
// core mat2nwb library.
#ifndef MAT2NWB_VERSION_STRING
  #define MAT2NWB_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return MAT2NWB_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

// Written into NWB files; matches the core schema the writer lays out.
inline const char* nwb_schema_version() {
  return "2.7.0";
}

} // namespace mat2nwb
