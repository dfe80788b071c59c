#include "mat2nwb/name_deriver.hpp"

#include "test_support.hpp"
#include <string>
#include <utility>
#include <vector>

static mat2nwb::ChannelRecord rec(const std::string& name, std::vector<std::string> fields) {
  mat2nwb::ChannelRecord r;
  r.name = name;
  r.value.cls = mat2nwb::MatClass::kStruct;
  r.value.field_names = std::move(fields);
  r.value.field_values.resize(r.value.field_names.size());
  return r;
}

int main() {
  using namespace mat2nwb;

  // Naming keys: record name, then record_subfield for each field.
  {
    const RecordSet rs = {rec("expA_ChR2", {"times", "values"}), rec("expA_Lick_times", {})};
    const auto keys = collect_naming_keys(rs);
    assert(keys.size() == 4);
    assert(keys[0] == "expA_ChR2");
    assert(keys[1] == "expA_ChR2_times");
    assert(keys[3] == "expA_Lick_times");
  }

  // Longest common prefix as a left fold.
  {
    assert(longest_common_prefix({}).empty());
    assert(longest_common_prefix({"abc"}) == "abc");
    assert(longest_common_prefix({"expA_ChR2", "expA_Lick"}) == "expA_");
    assert(longest_common_prefix({"expA_ChR2", "", "expA_Lick"}).empty());
    assert(longest_common_prefix({"abc", "xyz"}).empty());
  }

  // Word boundary trimming.
  {
    assert(trim_to_word_boundary("expA_Ch") == "expA_");
    assert(trim_to_word_boundary("mouse1_VLS_") == "mouse1_VLS_");
    assert(trim_to_word_boundary("expA").empty());
    assert(common_name_prefix({"expA_ChR2", "expA_Cherry"}) == "expA_");
  }

  // Output names.
  {
    assert(derive_output_name("expA_ChR2", "expA_") == "ChR2");
    assert(derive_output_name("expA_Lick_times", "expA_") == "Lick_times");
    assert(derive_output_name("expA_sub_ChR2", "expA_") == "ChR2");
    assert(derive_output_name("expA_ChR2", "") == "ChR2");
    assert(derive_output_name("ChR2", "") == "ChR2");
    assert(derive_output_name("other_ChR2", "expA_") == "other_ChR2");
    // Nothing left after stripping: keep the full name.
    assert(derive_output_name("expA_", "expA_") == "expA_");
    // A separator following the prefix is consumed once.
    assert(derive_output_name("expA__x", "expA_") == "x");
  }

  // Shared prefix "expA_": event channels keep their suffix.
  {
    const std::vector<std::string> names = {"expA_ChR2", "expA_X", "expA_Lick_times"};
    const std::string prefix = common_name_prefix(names);
    assert(prefix == "expA_");
    assert(derive_output_name("expA_ChR2", prefix) == "ChR2");
    assert(derive_output_name("expA_X", prefix) == "X");
    assert(derive_output_name("expA_Lick_times", prefix) == "Lick_times");
  }

  // Nothing in common: names without separators pass through.
  {
    const std::vector<std::string> names = {"foo", "bar"};
    const std::string prefix = common_name_prefix(names);
    assert(prefix.empty());
    assert(derive_output_name("foo", prefix) == "foo");
    assert(derive_output_name("bar", prefix) == "bar");
  }

  // Nothing in common, but separator-bearing names are still cut to their
  // last segment unless they are event channels.
  {
    const RecordSet rs = {rec("ChR2_raw", {"values"}), rec("Lick_times", {"times"})};
    const std::string prefix = common_name_prefix(collect_naming_keys(rs));
    assert(prefix.empty());
    assert(derive_output_name("ChR2_raw", prefix) == "raw");
    assert(derive_output_name("Lick_times", prefix) == "Lick_times");
  }

  // End to end over a record set.
  {
    const RecordSet rs = {rec("m1_VLS_ChR2", {"times", "values"}),
                          rec("m1_VLS_Lick_times", {"times", "values"})};
    const std::string prefix = common_name_prefix(collect_naming_keys(rs));
    assert(prefix == "m1_VLS_");
    assert(derive_output_name("m1_VLS_ChR2", prefix) == "ChR2");
    assert(derive_output_name("m1_VLS_Lick_times", prefix) == "Lick_times");
  }

  return 0;
}
