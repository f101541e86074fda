#pragma once

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace gridrun::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

// Accepts the `--log-level` spellings, case-insensitively. `warning` is kept
// as an alias for `warn`.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  struct Spelling {
    std::string_view name;
    LogLevel level;
  };
  static constexpr std::array<Spelling, 5> kSpellings = {{
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  }};

  error.clear();
  std::string normalized;
  normalized.reserve(raw.size());
  for (const unsigned char c : raw) {
    normalized.push_back(static_cast<char>(std::tolower(c)));
  }

  for (const auto& spelling : kSpellings) {
    if (normalized == spelling.name) {
      level = spelling.level;
      return true;
    }
  }

  error = raw.empty() ? std::string("missing value for --log-level")
                      : "invalid --log-level '" + std::string(raw) + "'";
  error += " (expected debug|info|warn|error)";
  return false;
}

// logfmt-style lines on stderr:
//   ts_utc=... level=INFO run_id="run-..." job="test-001" msg="..." key="value"
// Copies are cheap; job workers each hold a ForJob() copy and share the sink.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetRunId(std::string run_id) {
    run_id_ = std::move(run_id);
  }

  Logger ForJob(std::string job_id) const {
    Logger scoped(*this);
    scoped.job_id_ = std::move(job_id);
    return scoped;
  }

  bool Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) const {
    if (!Enabled(level)) {
      return;
    }

    std::string line = "ts_utc=" + core::FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "run_id", run_id_);
    if (!job_id_.empty()) {
      AppendField(line, "job", job_id_);
    }
    AppendField(line, "msg", message);
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line += '\n';

    const std::lock_guard<std::mutex> lock(SinkMutex());
    (*out_) << line << std::flush;
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
  }

  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line += ' ';
    line += key;
    line += '=';
    line += core::JsonString(value);
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string run_id_ = "-";
  std::string job_id_;
};

} // namespace gridrun::core::logging
