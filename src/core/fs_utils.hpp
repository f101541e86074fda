#ifndef GRIDRUN_CORE_FS_UTILS_HPP_
#define GRIDRUN_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace gridrun::core {

namespace detail {

// `<base>.<tag>.<tick>.<seq>`: unique within the process even when two
// workers ask in the same clock tick.
inline std::string UniqueSuffixedName(const std::filesystem::path& base, std::string_view tag) {
  static std::atomic<std::uint64_t> sequence{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  return base.string() + "." + std::string(tag) + "." + std::to_string(tick) + "." +
         std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed));
}

inline bool RenameOver(const std::filesystem::path& from, const std::filesystem::path& to,
                       std::error_code& ec) {
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return true;
  }
  // Some filesystems refuse to rename over an existing file.
  std::error_code ignored;
  std::filesystem::remove(to, ignored);
  ec.clear();
  std::filesystem::rename(from, to, ec);
  return !ec;
}

} // namespace detail

// Reads a whole file. Empty files are returned as an empty string; callers
// decide whether that is an error.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to read file: " + path.string();
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& path, std::string& error) {
  if (path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  if (!path.has_parent_path()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    error = "failed to create directory '" + path.parent_path().string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Writes `text` to a sibling temp file and renames it into place, so readers
// of report.json or a step script never see a half-written file.
inline bool WriteTextFileAtomic(const std::filesystem::path& path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }

  const std::filesystem::path staging = detail::UniqueSuffixedName(path, "tmp");
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out || !(out << text) || !out.flush()) {
      error = "failed to write staging file '" + staging.string() + "'";
      std::error_code ignored;
      std::filesystem::remove(staging, ignored);
      return false;
    }
  }

  std::error_code ec;
  if (detail::RenameOver(staging, path, ec)) {
    return true;
  }
  std::error_code ignored;
  std::filesystem::remove(staging, ignored);
  error = "failed to publish '" + path.string() + "': " + ec.message();
  return false;
}

// Unique path for a short-lived file (a step script) under `dir`.
inline std::filesystem::path MakeUniquePath(const std::filesystem::path& dir,
                                            std::string_view stem, std::string_view extension) {
  return detail::UniqueSuffixedName(dir / std::string(stem), "run") + std::string(extension);
}

} // namespace gridrun::core

#endif // GRIDRUN_CORE_FS_UTILS_HPP_
