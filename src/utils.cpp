#include "mat2nwb/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <system_error>

namespace mat2nwb {

namespace {

bool is_blank(unsigned char c) { return std::isspace(c) != 0; }

bool to_local_tm(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return localtime_s(out, &t) == 0;
#else
  return localtime_r(&t, out) != nullptr;
#endif
}

// strftime's %z gives "+hhmm"; ISO-8601 extended form wants "+hh:mm".
std::string iso_utc_offset(const std::tm& tm) {
  char buf[16] = {0};
  if (std::strftime(buf, sizeof(buf), "%z", &tm) != 5) return "+00:00";
  const std::string z(buf);
  return z.substr(0, 3) + ":" + z.substr(3, 2);
}

} // namespace

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](char c) {
    return is_blank(static_cast<unsigned char>(c));
  });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](char c) {
    return is_blank(static_cast<unsigned char>(c));
  }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> parts;
  if (s.empty()) return parts;
  std::size_t start = 0;
  for (;;) {
    const std::size_t pos = s.find(delim, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), s.begin());
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && std::equal(suffix.rbegin(), suffix.rend(), s.rbegin());
}

int to_int(const std::string& s) {
  const std::string t = trim(s);
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(t, &used, 10);
  } catch (const std::exception& e) {
    throw std::runtime_error("Invalid integer '" + s + "': " + e.what());
  }
  if (used != t.size()) {
    throw std::runtime_error("Invalid integer '" + s + "': unexpected trailing characters");
  }
  return v;
}

bool file_exists(const std::string& path) {
  return std::filesystem::exists(std::filesystem::u8path(path));
}

void ensure_directory(const std::string& path) {
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

std::string random_hex_token(std::size_t n_bytes) {
  static const char kDigits[] = "0123456789abcdef";
  std::random_device rd;
  std::uniform_int_distribution<int> byte(0, 255);

  std::string out;
  out.reserve(n_bytes * 2);
  for (std::size_t i = 0; i < n_bytes; ++i) {
    const int b = byte(rd);
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0xF]);
  }
  return out;
}

std::string random_uuid4() {
  std::string h = random_hex_token(16);
  h[12] = '4';
  // Variant 10xx: the high nibble of byte 8 is one of 8, 9, a, b.
  const char v = h[16];
  const int nib = std::isdigit(static_cast<unsigned char>(v)) ? v - '0' : v - 'a' + 10;
  h[16] = "89ab"[nib & 0x3];
  return h.substr(0, 8) + '-' + h.substr(8, 4) + '-' + h.substr(12, 4) + '-' + h.substr(16, 4) +
         '-' + h.substr(20);
}

std::string make_temp_sibling_path(const std::string& target) {
  const std::filesystem::path p = std::filesystem::u8path(target);
  const std::filesystem::path tmp_name =
      std::filesystem::u8path(p.filename().u8string() + ".tmp." + random_hex_token(8));
  return p.has_parent_path() ? (p.parent_path() / tmp_name).u8string() : tmp_name.u8string();
}

bool move_into_place(const std::string& tmp, const std::string& target, std::string* error) {
  const std::filesystem::path from = std::filesystem::u8path(tmp);
  const std::filesystem::path to = std::filesystem::u8path(target);

  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(to, rm_ec);
    ec.clear();
    std::filesystem::rename(from, to, ec);
  }
  if (ec) {
    if (error) *error = ec.message();
    return false;
  }
  return true;
}

std::string format_local_iso8601(std::time_t t, int millis) {
  std::tm tm{};
  if (!to_local_tm(t, &tm)) return std::string();
  millis = std::clamp(millis, 0, 999);

  char stamp[32] = {0};
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);
  char frac[8] = {0};
  std::snprintf(frac, sizeof(frac), ".%03d", millis);
  return std::string(stamp) + frac + iso_utc_offset(tm);
}

std::time_t local_midnight(std::time_t now) {
  std::tm tm{};
  if (!to_local_tm(now, &tm)) return now;
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  const std::time_t t = std::mktime(&tm);
  return t == static_cast<std::time_t>(-1) ? now : t;
}

} // namespace mat2nwb
