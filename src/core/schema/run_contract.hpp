#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace gridrun::core::schema {

// Invocation settings that shaped one pipeline run. Recorded so a report can
// be reproduced with the same flags.
struct RunConfig {
  std::string pipeline_id;
  std::string pipeline_path;
  std::string action_runner = "shell";
  std::size_t max_parallel = 1;
  std::optional<bool> fail_fast_override;
  std::optional<std::string> job_filter;
};

// Lifecycle timestamps captured for every run.
struct RunTimestamps {
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// RunInfo combines run identity, invocation config and timing into the
// header of `report.json`.
struct RunInfo {
  std::string run_id;
  RunConfig config;
  RunTimestamps timestamps;
};

// JSON serializers with canonical key ordering.
std::string ToJson(const RunConfig& run_config);
std::string ToJson(const RunTimestamps& timestamps);
std::string ToJson(const RunInfo& run_info);

} // namespace gridrun::core::schema
