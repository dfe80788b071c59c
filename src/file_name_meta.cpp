#include "mat2nwb/file_name_meta.hpp"

#include "mat2nwb/errors.hpp"
#include "mat2nwb/utils.hpp"

#include <filesystem>
#include <vector>

namespace mat2nwb {

std::string FileNameParts::identifier() const {
  std::string id = animal;
  if (!signal.empty()) id += "_" + signal;
  id += "_" + session;
  id += "_" + tag;
  return id;
}

std::string FileNameParts::nwb_file_name() const {
  return identifier() + ".nwb";
}

FileNameParts parse_file_name(const std::string& path) {
  const std::string stem = std::filesystem::u8path(path).stem().u8string();
  const std::vector<std::string> parts = split(stem, '_');

  if (parts.size() != 3 && parts.size() != 4) {
    throw UsageError("Invalid filename format '" + stem +
                     "'. Expected: animalname_[signal_]session_tag");
  }

  FileNameParts p;
  p.animal = parts[0];
  if (parts.size() == 4) {
    p.signal = parts[1];
    p.session = parts[2];
    p.tag = parts[3];
  } else {
    p.session = parts[1];
    p.tag = parts[2];
  }

  if (p.animal.empty() || p.session.empty() || p.tag.empty()) {
    throw UsageError("Animal, session, and tag components must be non-empty: '" + stem + "'");
  }
  return p;
}

} // namespace mat2nwb
