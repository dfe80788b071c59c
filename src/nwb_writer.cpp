#include "mat2nwb/nwb_writer.hpp"

#include "mat2nwb/errors.hpp"
#include "mat2nwb/orientation.hpp"
#include "mat2nwb/utils.hpp"
#include "mat2nwb/version.hpp"

#include <H5Cpp.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace mat2nwb {

TimeMajorLayout to_time_major_layout(const NumericArray& a, int time_axis) {
  if (time_axis < 1 || static_cast<std::size_t>(time_axis) > std::max<std::size_t>(a.ndims(), 2)) {
    throw std::invalid_argument("to_time_major_layout: invalid time axis " +
                                std::to_string(time_axis));
  }

  TimeMajorLayout out;
  if (a.is_vector()) {
    out.dims = {a.numel()};
    out.data = a.data;
    return out;
  }

  const std::size_t t = static_cast<std::size_t>(time_axis - 1);
  std::vector<std::size_t> others;
  for (std::size_t k = 0; k < a.ndims(); ++k) {
    if (k != t) others.push_back(k);
  }

  out.dims.push_back(a.dim(t));
  for (std::size_t k : others) out.dims.push_back(a.dim(k));

  // A column-major array with the HDF5 dims reversed has the same memory
  // order as the row-major HDF5 array.
  std::vector<std::size_t> order(others.rbegin(), others.rend());
  order.push_back(t);
  out.data = permute(a, order).data;
  return out;
}

namespace {

const char* const kNamespace = "core";

H5::StrType utf8_string_type() {
  H5::StrType st(H5::PredType::C_S1, H5T_VARIABLE);
  st.setCset(H5T_CSET_UTF8);
  return st;
}

void write_string_attr(H5::H5Object& obj, const char* name, const std::string& value) {
  const H5::StrType st = utf8_string_type();
  H5::Attribute a = obj.createAttribute(name, st, H5::DataSpace(H5S_SCALAR));
  a.write(st, value);
}

void write_double_attr(H5::H5Object& obj, const char* name, double value) {
  H5::Attribute a = obj.createAttribute(name, H5::PredType::IEEE_F64LE, H5::DataSpace(H5S_SCALAR));
  a.write(H5::PredType::NATIVE_DOUBLE, &value);
}

void write_int_attr(H5::H5Object& obj, const char* name, int value) {
  H5::Attribute a = obj.createAttribute(name, H5::PredType::STD_I32LE, H5::DataSpace(H5S_SCALAR));
  a.write(H5::PredType::NATIVE_INT, &value);
}

void write_string_dataset(H5::Group& g, const char* name, const std::string& value) {
  const H5::StrType st = utf8_string_type();
  H5::DataSet ds = g.createDataSet(name, st, H5::DataSpace(H5S_SCALAR));
  ds.write(value, st);
}

void write_string_array(H5::Group& g, const char* name, const std::vector<std::string>& values) {
  const H5::StrType st = utf8_string_type();
  const hsize_t n = values.size();
  H5::DataSpace sp(1, &n);
  H5::DataSet ds = g.createDataSet(name, st, sp);
  std::vector<const char*> ptrs;
  ptrs.reserve(values.size());
  for (const auto& v : values) ptrs.push_back(v.c_str());
  if (!ptrs.empty()) ds.write(ptrs.data(), st);
}

void mark_neurodata(H5::H5Object& obj, const char* type) {
  write_string_attr(obj, "namespace", kNamespace);
  write_string_attr(obj, "neurodata_type", type);
  write_string_attr(obj, "object_id", random_uuid4());
}

const H5::PredType& file_type_for(MatClass c) {
  switch (c) {
    case MatClass::kSingle: return H5::PredType::IEEE_F32LE;
    case MatClass::kInt8: return H5::PredType::STD_I8LE;
    case MatClass::kUInt8: return H5::PredType::STD_U8LE;
    case MatClass::kInt16: return H5::PredType::STD_I16LE;
    case MatClass::kUInt16: return H5::PredType::STD_U16LE;
    case MatClass::kInt32: return H5::PredType::STD_I32LE;
    case MatClass::kUInt32: return H5::PredType::STD_U32LE;
    case MatClass::kInt64: return H5::PredType::STD_I64LE;
    case MatClass::kUInt64: return H5::PredType::STD_U64LE;
    default: return H5::PredType::IEEE_F64LE;
  }
}

std::size_t element_size(MatClass c) {
  switch (c) {
    case MatClass::kInt8:
    case MatClass::kUInt8: return 1;
    case MatClass::kInt16:
    case MatClass::kUInt16: return 2;
    case MatClass::kSingle:
    case MatClass::kInt32:
    case MatClass::kUInt32: return 4;
    default: return 8;
  }
}

void write_time_series(H5::Group& acquisition, const TimeSeries& ts, const NwbWriterOptions& opts) {
  H5::Group g = acquisition.createGroup(ts.name);
  mark_neurodata(g, "TimeSeries");
  write_string_attr(g, "description", ts.description);
  write_string_attr(g, "comments", ts.comments);

  const TimeMajorLayout layout = to_time_major_layout(ts.data, ts.time_axis);
  std::vector<hsize_t> hdims(layout.dims.begin(), layout.dims.end());
  H5::DataSpace sp(static_cast<int>(hdims.size()), hdims.data());

  H5::DSetCreatPropList dcpl;
  const bool any_zero = std::find(hdims.begin(), hdims.end(), 0) != hdims.end();
  if (opts.compression_level > 0 && !any_zero) {
    std::vector<hsize_t> chunk = hdims;
    hsize_t row = 1;
    for (std::size_t k = 1; k < chunk.size(); ++k) row *= chunk[k];
    const hsize_t row_bytes = row * element_size(ts.data_class);
    const hsize_t rows = std::max<hsize_t>(1, opts.chunk_bytes / std::max<hsize_t>(row_bytes, 1));
    chunk[0] = std::min(hdims[0], rows);
    dcpl.setChunk(static_cast<int>(chunk.size()), chunk.data());
    dcpl.setDeflate(std::min(opts.compression_level, 9));
  }

  H5::DataSet data = g.createDataSet("data", file_type_for(ts.data_class), sp, dcpl);
  if (!layout.data.empty()) data.write(layout.data.data(), H5::PredType::NATIVE_DOUBLE);
  write_double_attr(data, "conversion", ts.conversion);
  write_double_attr(data, "offset", ts.offset);
  write_double_attr(data, "resolution", ts.resolution);
  write_string_attr(data, "unit", ts.unit);

  if (ts.regular) {
    H5::DataSet st = g.createDataSet("starting_time", H5::PredType::IEEE_F64LE,
                                     H5::DataSpace(H5S_SCALAR));
    st.write(&ts.starting_time, H5::PredType::NATIVE_DOUBLE);
    write_double_attr(st, "rate", ts.rate);
    write_string_attr(st, "unit", "seconds");
  } else {
    const hsize_t n = ts.timestamps.size();
    H5::DataSpace tsp(1, &n);
    H5::DataSet t = g.createDataSet("timestamps", H5::PredType::IEEE_F64LE, tsp);
    if (n > 0) t.write(ts.timestamps.data(), H5::PredType::NATIVE_DOUBLE);
    write_int_attr(t, "interval", 1);
    write_string_attr(t, "unit", "seconds");
  }
}

void write_nwb_contents(H5::H5File& file, const NwbFile& nwb, const NwbWriterOptions& opts) {
  const SessionMetadata& s = nwb.session();

  H5::Group root = file.openGroup("/");
  mark_neurodata(root, "NWBFile");
  write_string_attr(root, "nwb_version", nwb_schema_version());

  write_string_dataset(root, "identifier", s.identifier);
  write_string_dataset(root, "session_description", s.session_description);
  write_string_dataset(root, "session_start_time", s.session_start_time);
  write_string_dataset(root, "timestamps_reference_time", s.timestamps_reference_time);
  write_string_array(root, "file_create_date", {s.file_create_date});

  H5::Group acquisition = root.createGroup("acquisition");
  root.createGroup("analysis");
  root.createGroup("processing");
  H5::Group stimulus = root.createGroup("stimulus");
  stimulus.createGroup("presentation");
  stimulus.createGroup("templates");

  H5::Group general = root.createGroup("general");
  write_string_array(general, "experimenter", s.experimenter);
  write_string_dataset(general, "institution", s.institution);
  write_string_dataset(general, "notes", s.notes);
  write_string_dataset(general, "session_id", s.session_id);
  H5::Group subject = general.createGroup("subject");
  mark_neurodata(subject, "Subject");
  write_string_dataset(subject, "subject_id", s.subject_id);

  for (const auto& ts : nwb.acquisition()) {
    write_time_series(acquisition, ts, opts);
  }
}

void remove_quietly(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
}

} // namespace

void NwbWriter::write(const NwbFile& nwb, const std::string& path) {
  if (opts_.compression_level < 0 || opts_.compression_level > 9) {
    throw ExportError("Invalid compression level " + std::to_string(opts_.compression_level) +
                      " (expected 0..9)");
  }

  const std::filesystem::path tmp = std::filesystem::u8path(make_temp_sibling_path(path));

  H5::Exception::dontPrint();
  try {
    H5::H5File file(tmp.u8string(), H5F_ACC_TRUNC);
    write_nwb_contents(file, nwb, opts_);
    file.close();
  } catch (const H5::Exception& e) {
    remove_quietly(tmp);
    throw ExportError("Failed to write NWB file " + path + ": " + e.getDetailMsg());
  } catch (const std::exception& e) {
    remove_quietly(tmp);
    throw ExportError("Failed to write NWB file " + path + ": " + e.what());
  }

  std::string move_error;
  if (!move_into_place(tmp.u8string(), path, &move_error)) {
    remove_quietly(tmp);
    throw ExportError("Failed to move NWB file into place at " + path + ": " + move_error);
  }
}

} // namespace mat2nwb
