#include "mat2nwb/nwb_file.hpp"

#include <utility>

namespace mat2nwb {

bool NwbFile::add_acquisition(TimeSeries ts) {
  for (auto& existing : acquisition_) {
    if (existing.name == ts.name) {
      existing = std::move(ts);
      return true;
    }
  }
  acquisition_.push_back(std::move(ts));
  return false;
}

const TimeSeries* NwbFile::find_acquisition(const std::string& name) const {
  for (const auto& ts : acquisition_) {
    if (ts.name == name) return &ts;
  }
  return nullptr;
}

} // namespace mat2nwb
