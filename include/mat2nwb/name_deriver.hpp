#pragma once

#include "mat2nwb/types.hpp"

#include <string>
#include <vector>

namespace mat2nwb {

// Output-name derivation by common-prefix stripping.
//
// Recordings exported from one session usually share a naming convention
// (e.g. "expA_ChR2", "expA_Lick_times"). The shared prefix is detected across
// every channel name and every "channel_subfield" name, cut back to a word
// boundary, and stripped from the names written to the NWB file.

constexpr char kNameSeparator = '_';

// Event channels keep this suffix (and everything before it after prefix
// stripping) instead of being reduced to their last segment.
extern const char* const kEventSuffix;  // "_times"

// Names fed to longest_common_prefix(), in discovery order: for each record,
// its name followed by name + "_" + subfield for each of its sub-fields.
std::vector<std::string> collect_naming_keys(const RecordSet& records);

// Longest prefix shared by all names, computed as a left fold starting from
// the first name. Empty input, any empty name, or a zero-length match yields
// an empty prefix.
std::string longest_common_prefix(const std::vector<std::string>& names);

// Cut `prefix` back so it ends at its last separator (inclusive). A prefix
// without any separator is discarded (empty result).
std::string trim_to_word_boundary(const std::string& prefix, char sep = kNameSeparator);

// trim_to_word_boundary(longest_common_prefix(names)).
std::string common_name_prefix(const std::vector<std::string>& names);

// Derive the output name for `full_name`:
// - full_name does not start with prefix: full_name unchanged
// - otherwise (always the case for an empty prefix) strip the prefix and one following separator; a remainder that
//   ends with kEventSuffix is kept whole, anything else is reduced to its last
//   separator-delimited segment
// - an empty result falls back to full_name
std::string derive_output_name(const std::string& full_name, const std::string& prefix);

} // namespace mat2nwb
