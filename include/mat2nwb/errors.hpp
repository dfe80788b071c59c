#pragma once

#include <stdexcept>
#include <string>

namespace mat2nwb {

// Error taxonomy for a conversion run.
//
// All errors derive from std::runtime_error so CLI main() functions can keep a
// single catch (const std::exception&) and still map specific failures to exit
// codes. Per-channel classification failures are not exceptions; they are
// reported as skip diagnostics (see diagnostics.hpp).

// Missing/invalid command-line arguments or an input filename that does not
// follow the animal_[signal_]session_tag convention.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The input path does not exist.
class SourceNotFound : public std::runtime_error {
public:
  explicit SourceNotFound(const std::string& path)
      : std::runtime_error("File not found: " + path), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// The source file is unreadable or not a supported MAT-file.
class LoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Writing or serializing the NWB container failed.
class ExportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace mat2nwb
