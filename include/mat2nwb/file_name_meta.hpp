#pragma once

#include <string>

namespace mat2nwb {

// Session tags encoded in the source file name.
//
// Convention: animal_[signal_]session_tag.ext, i.e. exactly 3 or 4
// underscore-delimited components in the file stem. Examples:
//   mouse1_VLS_42_control.mat -> animal=mouse1 signal=VLS session=42 tag=control
//   Jack_42_sham.mat          -> animal=Jack   signal=""  session=42 tag=sham
struct FileNameParts {
  std::string animal;
  std::string signal;  // empty when the file name has 3 components
  std::string session;
  std::string tag;

  // Components joined with '_' (signal omitted when empty). Used as the NWB
  // identifier and as the output file stem.
  std::string identifier() const;

  // identifier() + ".nwb"
  std::string nwb_file_name() const;
};

// Parse the stem of `path` (directories and extension are ignored).
//
// Throws UsageError if the stem does not have 3 or 4 components, or if the
// animal, session or tag component is empty.
FileNameParts parse_file_name(const std::string& path);

} // namespace mat2nwb
