#include "mat2nwb/name_deriver.hpp"

#include "mat2nwb/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>

namespace mat2nwb {

const char* const kEventSuffix = "_times";

std::vector<std::string> collect_naming_keys(const RecordSet& records) {
  std::vector<std::string> keys;
  for (const auto& rec : records) {
    keys.push_back(rec.name);
    for (const auto& f : rec.value.field_names) {
      keys.push_back(rec.name + kNameSeparator + f);
    }
  }
  return keys;
}

static std::size_t shared_length(const std::string& a, const std::string& b) {
  const std::size_t n = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < n && a[i] == b[i]) ++i;
  return i;
}

std::string longest_common_prefix(const std::vector<std::string>& names) {
  if (names.empty()) return std::string();

  // The accumulator only ever narrows; once it is empty it stays empty.
  return std::accumulate(names.begin() + 1, names.end(), names.front(),
                         [](const std::string& acc, const std::string& name) {
                           if (acc.empty() || name.empty()) return std::string();
                           return acc.substr(0, shared_length(acc, name));
                         });
}

std::string trim_to_word_boundary(const std::string& prefix, char sep) {
  const std::size_t pos = prefix.rfind(sep);
  if (pos == std::string::npos) return std::string();
  return prefix.substr(0, pos + 1);
}

std::string common_name_prefix(const std::vector<std::string>& names) {
  return trim_to_word_boundary(longest_common_prefix(names));
}

std::string derive_output_name(const std::string& full_name, const std::string& prefix) {
  if (!starts_with(full_name, prefix)) return full_name;

  std::string stripped = full_name.substr(prefix.size());
  if (!stripped.empty() && stripped[0] == kNameSeparator) stripped.erase(0, 1);

  std::string out;
  if (ends_with(stripped, kEventSuffix)) {
    out = stripped;
  } else {
    const std::size_t pos = stripped.rfind(kNameSeparator);
    out = (pos == std::string::npos) ? stripped : stripped.substr(pos + 1);
  }

  return out.empty() ? full_name : out;
}

} // namespace mat2nwb
