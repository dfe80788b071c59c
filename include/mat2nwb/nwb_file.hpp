#pragma once

#include "mat2nwb/types.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace mat2nwb {

// File-level NWB metadata (NWBFile root datasets and /general).
struct SessionMetadata {
  std::string identifier;
  std::string session_description;

  // ISO-8601 with UTC offset, e.g. 2026-01-15T00:00:12.250-05:00
  std::string session_start_time;
  std::string timestamps_reference_time;
  std::string file_create_date;

  std::vector<std::string> experimenter;
  std::string institution;
  std::string notes;
  std::string session_id;
  std::string subject_id;
};

// In-memory NWB TimeSeries.
//
// data is kept in MATLAB layout (column-major) together with the 1-based axis
// along which time varies; the writer lays it out time-first on disk.
struct TimeSeries {
  std::string name;
  std::string description;
  std::string comments{"no comments"};
  std::string unit{"unknown"};
  double conversion{1.0};
  double offset{0.0};
  double resolution{-1.0};

  MatClass data_class{MatClass::kDouble};  // on-disk element type
  NumericArray data;
  int time_axis{1};

  // Regular sampling: starting_time + rate. Otherwise: timestamps.
  bool regular{true};
  double starting_time{0.0};
  double rate{1.0};
  std::vector<double> timestamps;

  std::size_t n_samples() const { return data.dim(static_cast<std::size_t>(time_axis - 1)); }
};

// An NWB file under construction: session metadata plus the acquisition
// TimeSeries, in insertion order.
class NwbFile {
public:
  explicit NwbFile(SessionMetadata session) : session_(std::move(session)) {}

  const SessionMetadata& session() const { return session_; }

  // Register ts under /acquisition/<ts.name>. An existing entry with the same
  // name is replaced in place (last write wins); returns true in that case.
  bool add_acquisition(TimeSeries ts);

  const std::vector<TimeSeries>& acquisition() const { return acquisition_; }

  // nullptr if no TimeSeries has that name.
  const TimeSeries* find_acquisition(const std::string& name) const;

private:
  SessionMetadata session_;
  std::vector<TimeSeries> acquisition_;
};

} // namespace mat2nwb
