#ifndef GRIDRUN_TESTS_COMMON_TEMP_DIR_HPP_
#define GRIDRUN_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace gridrun::tests::common {

// Fresh directory under the system temp root. Smoke tests run in parallel
// under CTest, so callers pass a prefix naming the test.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  const auto now_us = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_us));

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

// Removes the directory when the test scope ends, pass or fail-by-exception.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(CreateUniqueTempDir(prefix)) {}
  ~ScopedTempDir() {
    RemovePathBestEffort(path_);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace gridrun::tests::common

#endif // GRIDRUN_TESTS_COMMON_TEMP_DIR_HPP_
