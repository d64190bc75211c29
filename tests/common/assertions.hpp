#ifndef PHOTONCOUNT_TESTS_COMMON_ASSERTIONS_HPP_
#define PHOTONCOUNT_TESTS_COMMON_ASSERTIONS_HPP_

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace photoncount::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

inline void AssertNear(double actual, double expected, double tolerance, std::string_view label) {
  if (std::isfinite(actual) && std::fabs(actual - expected) <= tolerance) {
    return;
  }
  std::cerr << label << ": expected " << expected << " +/- " << tolerance << ", got " << actual
            << '\n';
  std::abort();
}

inline void WriteFixtureFile(const std::filesystem::path& path, std::string_view contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to create fixture file: " + path.string());
  }
  out << contents;
  if (!out) {
    Fail("failed to write fixture file: " + path.string());
  }
}

inline std::size_t CountLines(std::string_view text) {
  std::size_t lines = 0;
  for (const char ch : text) {
    if (ch == '\n') {
      ++lines;
    }
  }
  return lines;
}

} // namespace photoncount::tests::common

#endif // PHOTONCOUNT_TESTS_COMMON_ASSERTIONS_HPP_
