#include "mat2nwb/sampling.hpp"

#include "test_support.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace mat2nwb;

  assert(approx(sample_stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.138089935299395));
  assert(sample_stddev({1.0}) == 0.0);

  // Regular: start + rate, timestamps dropped.
  {
    const SamplingInfo s = classify_sampling({10.0, 10.5, 11.0, 11.5});
    assert(s.is_regular);
    assert(approx(s.sampling_rate_hz, 2.0));
    assert(approx(s.start_time, 10.0));
    assert(s.timestamps.empty());
  }

  // Single timestamp: regular at 1 Hz.
  {
    const SamplingInfo s = classify_sampling({3.25});
    assert(s.is_regular);
    assert(s.sampling_rate_hz == 1.0);
    assert(s.start_time == 3.25);
  }

  // Jitter above the tolerance: irregular, timestamps verbatim.
  {
    const std::vector<double> t = {0.0, 1.0, 2.0, 3.5};
    const SamplingInfo s = classify_sampling(t);
    assert(!s.is_regular);
    assert(s.timestamps == t);
  }

  // Any constant spacing is regular with rate 1/dt, whatever its sign.
  {
    const SamplingInfo down = classify_sampling({3.0, 2.0, 1.0});
    assert(down.is_regular);
    assert(approx(down.sampling_rate_hz, -1.0));
    assert(approx(down.start_time, 3.0));
    assert(down.timestamps.empty());

    const SamplingInfo flat = classify_sampling({5.0, 5.0, 5.0});
    assert(flat.is_regular);
    assert(std::isinf(flat.sampling_rate_hz));
    assert(flat.start_time == 5.0);
  }

  // NaN in the sequence: irregular.
  assert(!classify_sampling({0.0, std::nan(""), 2.0}).is_regular);

  assert(mat2nwb_test::throws_as<std::invalid_argument>([] { classify_sampling({}); }));
  return 0;
}
