#include "mat2nwb/sampling.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace mat2nwb {

double sample_stddev(const std::vector<double>& v) {
  const std::size_t n = v.size();
  if (n < 2) return 0.0;

  double mean = 0.0;
  for (double x : v) mean += x;
  mean /= static_cast<double>(n);

  double ss = 0.0;
  for (double x : v) {
    const double d = x - mean;
    ss += d * d;
  }
  return std::sqrt(ss / static_cast<double>(n - 1));
}

SamplingInfo classify_sampling(const std::vector<double>& timestamps) {
  if (timestamps.empty()) {
    throw std::invalid_argument("classify_sampling: empty timestamp sequence");
  }

  SamplingInfo info;
  info.start_time = timestamps[0];

  if (timestamps.size() == 1) {
    info.is_regular = true;
    info.sampling_rate_hz = 1.0;
    return info;
  }

  std::vector<double> diffs(timestamps.size() - 1);
  for (std::size_t i = 1; i < timestamps.size(); ++i) {
    diffs[i - 1] = timestamps[i] - timestamps[i - 1];
  }

  // NaN stddev compares false and falls through to irregular.
  const double sd = sample_stddev(diffs);
  if (sd < kRegularSamplingTolerance) {
    info.is_regular = true;
    info.sampling_rate_hz = 1.0 / diffs[0];
    return info;
  }

  info.is_regular = false;
  info.sampling_rate_hz = 0.0;
  info.timestamps = timestamps;
  return info;
}

} // namespace mat2nwb
