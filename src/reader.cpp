#include "mat2nwb/reader.hpp"

#include "mat2nwb/errors.hpp"
#include "mat2nwb/mat5_reader.hpp"
#include "mat2nwb/mat73_reader.hpp"

#include <H5Cpp.h>

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace mat2nwb {

const char* mat_format_name(MatFormat f) {
  switch (f) {
    case MatFormat::kV5: return "MAT v5";
    case MatFormat::kV73: return "MAT v7.3 (HDF5)";
  }
  return "unknown";
}

MatFormat detect_mat_format(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw LoadError("Failed to open MAT-file: " + path);

  unsigned char hdr[128] = {0};
  f.read(reinterpret_cast<char*>(hdr), sizeof(hdr));
  if (f.gcount() == static_cast<std::streamsize>(sizeof(hdr))) {
    bool big_endian = false;
    bool has_indicator = true;
    if (hdr[126] == 'I' && hdr[127] == 'M') {
      big_endian = false;
    } else if (hdr[126] == 'M' && hdr[127] == 'I') {
      big_endian = true;
    } else {
      has_indicator = false;
    }
    if (has_indicator) {
      const std::uint16_t version = big_endian
          ? static_cast<std::uint16_t>((hdr[124] << 8) | hdr[125])
          : static_cast<std::uint16_t>(hdr[124] | (hdr[125] << 8));
      if (version == 0x0100) return MatFormat::kV5;
      if (version == 0x0200) return MatFormat::kV73;
    }
  }
  f.close();

  H5::Exception::dontPrint();
  bool is_hdf5 = false;
  try {
    is_hdf5 = H5::H5File::isHdf5(path);
  } catch (const H5::Exception& e) {
    throw LoadError("Failed to probe " + path + " for HDF5: " + e.getDetailMsg());
  }
  if (is_hdf5) return MatFormat::kV73;

  throw LoadError("Not a supported MAT-file (expected MAT v5 or v7.3): " + path);
}

RecordSet read_mat_file_auto(const std::string& path) {
  RecordSet records;
  if (detect_mat_format(path) == MatFormat::kV5) {
    Mat5Reader r;
    records = r.read(path);
  } else {
    Mat73Reader r;
    records = r.read(path);
  }
  if (records.empty()) {
    throw LoadError("MAT-file contains no variables: " + path);
  }
  return records;
}

} // namespace mat2nwb
