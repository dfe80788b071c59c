#pragma once

#include <vector>

namespace mat2nwb {

// Timestamps whose consecutive differences have a sample standard deviation
// below this value (same unit as the timestamps) are treated as regularly
// sampled.
constexpr double kRegularSamplingTolerance = 1e-10;

// Regular channels are stored as start time + rate; irregular channels keep
// every timestamp.
struct SamplingInfo {
  bool is_regular{true};
  double sampling_rate_hz{1.0};    // valid only if is_regular
  double start_time{0.0};
  std::vector<double> timestamps;  // valid only if !is_regular
};

// Sample standard deviation (N-1 normalization). Returns 0 for fewer than two
// values.
double sample_stddev(const std::vector<double>& v);

// Classify a timestamp sequence:
// - 1 element: regular, rate 1.0, start = t[0]
// - otherwise: regular when stddev(diff(t)) < kRegularSamplingTolerance
//   (rate = 1/diff[0], so zero spacing gives an infinite rate and decreasing
//   timestamps a negative one); irregular otherwise, with the timestamps kept
//   verbatim.
//
// Throws std::invalid_argument for an empty sequence.
SamplingInfo classify_sampling(const std::vector<double>& timestamps);

} // namespace mat2nwb
