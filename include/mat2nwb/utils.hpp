#pragma once

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

namespace mat2nwb {

std::string trim(const std::string& s);

std::vector<std::string> split(const std::string& s, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict integer parsing: surrounding whitespace is ignored, anything else
// that is not part of the number throws std::runtime_error.
int to_int(const std::string& s);

bool file_exists(const std::string& path);
void ensure_directory(const std::string& path);

// 2*n_bytes lowercase hex digits from std::random_device. Not for secrets.
std::string random_hex_token(std::size_t n_bytes = 16);

// Random RFC 4122 version 4 UUID in canonical lowercase form, e.g.
//   1b4e28ba-2fa1-41d2-883f-0016d3cca427
std::string random_uuid4();

// Path of a fresh temporary sibling of `target` (same directory, so a later
// rename stays on the same filesystem). The file is not created.
std::string make_temp_sibling_path(const std::string& target);

// Rename `tmp` onto `target`. If the plain rename fails (e.g. on Windows when
// `target` exists), the existing target is removed and the rename retried.
// Returns false with a message in *error if the file could not be moved; `tmp`
// is left for the caller to clean up.
bool move_into_place(const std::string& tmp, const std::string& target, std::string* error);

// Format a local time as ISO-8601 with milliseconds and numeric UTC offset,
// e.g. 2026-01-15T00:00:12.250-05:00.
//
// `t` is the whole-second instant; `millis` (0..999) is appended as the
// fractional part.
std::string format_local_iso8601(std::time_t t, int millis);

// Local midnight (00:00:00) of the day containing `now`.
std::time_t local_midnight(std::time_t now);

} // namespace mat2nwb
