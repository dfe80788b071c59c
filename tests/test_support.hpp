#pragma once

// Test support helpers.
//
// Tests use assert(expr), but NDEBUG (set by most Release builds) would
// compile the standard macro away. This header replaces it with an always-on
// check that prints the failed expression and exits non-zero.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace mat2nwb_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

// Run `fn` and report whether it threw an exception of type E.
template <typename E, typename Fn>
bool throws_as(Fn fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (...) {
    return false;
  }
  return false;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Removes a scratch file on scope exit.
struct TempFile {
  std::string path;
  explicit TempFile(std::string p) : path(std::move(p)) { std::remove(path.c_str()); }
  ~TempFile() { std::remove(path.c_str()); }
};

} // namespace mat2nwb_test

#ifndef MAT2NWB_TEST_ASSERT
#define MAT2NWB_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::mat2nwb_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) MAT2NWB_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) MAT2NWB_TEST_ASSERT(expr)
#endif
