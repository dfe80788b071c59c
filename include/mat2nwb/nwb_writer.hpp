#pragma once

#include "mat2nwb/nwb_file.hpp"
#include "mat2nwb/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mat2nwb {

// Destination of an assembled NWB file.
//
// Implementations throw ExportError on failure and must not leave a partial
// file at `path`.
class IContainerWriter {
public:
  virtual ~IContainerWriter() = default;
  virtual void write(const NwbFile& nwb, const std::string& path) = 0;
};

struct NwbWriterOptions {
  // gzip (deflate) level for TimeSeries data, 0..9. 0 => contiguous,
  // uncompressed datasets.
  int compression_level{3};

  // Upper bound for one data chunk. Chunks always span the full extent of
  // every non-time dimension.
  std::size_t chunk_bytes{1 << 20};
};

// NWB 2.x writer on top of the HDF5 C++ API.
//
// Layout (NWB core schema):
//   /                       namespace, neurodata_type=NWBFile, nwb_version, object_id
//   /identifier, /session_description, /session_start_time,
//   /timestamps_reference_time, /file_create_date
//   /acquisition/<name>     TimeSeries (data + starting_time or timestamps)
//   /analysis, /processing, /stimulus/{presentation,templates}
//   /general/{experimenter,institution,notes,session_id,subject}
//
// The file is written to a temporary sibling of `path` and renamed into place
// once it has been closed.
class NwbWriter : public IContainerWriter {
public:
  explicit NwbWriter(NwbWriterOptions opts = NwbWriterOptions{}) : opts_(opts) {}

  void write(const NwbFile& nwb, const std::string& path) override;

private:
  NwbWriterOptions opts_;
};

// On-disk layout of a TimeSeries data array.
struct TimeMajorLayout {
  std::vector<std::size_t> dims;  // HDF5 dims; dims[0] is time
  std::vector<double> data;       // row-major (C order)
};

// Reorder a MATLAB (column-major) array so time is HDF5 dimension 0 and the
// remaining dimensions follow in MATLAB order. Vectors become 1-D.
//
// Throws std::invalid_argument if time_axis is not a valid 1-based axis.
TimeMajorLayout to_time_major_layout(const NumericArray& a, int time_axis);

} // namespace mat2nwb
