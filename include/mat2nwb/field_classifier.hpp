#pragma once

#include "mat2nwb/diagnostics.hpp"
#include "mat2nwb/sampling.hpp"
#include "mat2nwb/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mat2nwb {

// Candidate field names, probed in priority order (case-sensitive).
const std::vector<std::string>& time_field_candidates();   // times, time, t, timestamps
const std::vector<std::string>& value_field_candidates();  // values, value, data, signal, ...

// First candidate that names a field of `record` (regardless of the field's
// type), or nullopt if none does.
std::optional<std::string> first_present_field(const MatValue& record,
                                               const std::vector<std::string>& candidates);

// A channel ready for assembly into an NWB TimeSeries.
struct ClassifiedChannel {
  std::string channel;      // source record name
  std::string description;  // pre-stripping name: channel, or channel_subfield (fallback)
  std::string output_name;  // assigned once via derive_output_name()

  std::optional<std::string> time_field;   // canonical path only
  std::optional<std::string> value_field;  // canonical path, or the fallback sub-field
  bool used_fallback{false};

  MatClass data_class{MatClass::kDouble};
  NumericArray data;  // oriented for output
  int time_axis{2};   // 1-based axis of `data` along which time varies

  std::vector<std::size_t> timestamps_dims;  // shape of the (oriented) time source
  SamplingInfo sampling;

  // Samples along the time axis of `data`.
  std::size_t n_samples() const { return data.dim(static_cast<std::size_t>(time_axis - 1)); }
};

struct ClassificationResult {
  std::optional<ClassifiedChannel> channel;  // nullopt => channel skipped
  std::vector<Diagnostic> diagnostics;

  bool skipped() const { return !channel.has_value(); }
};

// Classify one record:
//
// 1) canonical: first present time-like and value-like fields; both must be
//    non-empty numeric arrays and the time array a vector. Vectors are laid
//    out as rows (time along axis 2); other arrays are made time-major.
// 2) fallback: the first direct sub-field (declaration order) that is a
//    non-empty numeric array with more than one row after orientation
//    correction, with synthetic timestamps 0..N-1.
// 3) otherwise the channel is skipped, with a diagnostic describing every
//    sub-field so the record can be fixed up by hand.
ClassificationResult classify_channel(const ChannelRecord& record);

} // namespace mat2nwb
