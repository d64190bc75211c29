#ifndef PHOTONCOUNT_TESTS_COMMON_TEMP_DIR_HPP_
#define PHOTONCOUNT_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace photoncount::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Monitor sessions write into `<out>/session-<millis>/`; tests run exactly one
// session per output root.
inline std::filesystem::path ResolveSingleSessionDir(const std::filesystem::path& out_root) {
  if (!std::filesystem::exists(out_root)) {
    Fail("output root does not exist: " + out_root.string());
  }

  std::vector<std::filesystem::path> session_dirs;
  for (const auto& entry : std::filesystem::directory_iterator(out_root)) {
    if (!entry.is_directory()) {
      continue;
    }
    if (entry.path().filename().string().rfind("session-", 0U) == 0U) {
      session_dirs.push_back(entry.path());
    }
  }

  if (session_dirs.size() != 1U) {
    Fail("expected exactly one session directory under " + out_root.string());
  }
  return session_dirs.front();
}

} // namespace photoncount::tests::common

#endif // PHOTONCOUNT_TESTS_COMMON_TEMP_DIR_HPP_
