#ifndef GRIDRUN_CORE_TIME_UTILS_HPP_
#define GRIDRUN_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace gridrun::core {

namespace detail {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

} // namespace detail

// Canonical UTC timestamp formatter used by reports, events and the logger.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Sortable, filesystem-safe run id: `run-YYYYMMDDTHHMMSS-mmm`.
inline std::string MakeRunId(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "run-" + std::to_string(millis_since_epoch);
  }

  std::ostringstream out;
  out << "run-" << std::put_time(&utc_time, "%Y%m%dT%H%M%S") << '-' << std::setw(3)
      << std::setfill('0') << millis_component;
  return out.str();
}

inline std::int64_t ElapsedMs(std::chrono::steady_clock::time_point start,
                              std::chrono::steady_clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

} // namespace gridrun::core

#endif // GRIDRUN_CORE_TIME_UTILS_HPP_
