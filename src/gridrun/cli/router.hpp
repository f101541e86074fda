#pragma once

#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace gridrun::cli {

// Options for `gridrun run`, shared with in-process callers so both take the
// same path through planning, execution and artifact writing.
struct RunOptions {
  std::string pipeline_path;
  std::filesystem::path output_dir = "out";
  // 0 means hardware concurrency.
  std::size_t max_parallel = 0;
  std::optional<bool> fail_fast_override;
  bool dry_run = false;
  // Restricts the run to one job template.
  std::optional<std::string> job_filter;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Paths and verdict of one run, for callers that chain follow-up work without
// parsing CLI text.
struct PipelineRunResult {
  std::string run_id;
  std::filesystem::path run_dir;
  std::filesystem::path report_json_path;
  std::filesystem::path summary_md_path;
  std::filesystem::path events_jsonl_path;
  bool success = false;
  bool cancelled = false;
};

// Executes one pipeline run through the same internal path as `gridrun run`.
// SIGINT/SIGTERM request cooperative cancellation while the run is active.
int ExecutePipelineRun(const RunOptions& options, PipelineRunResult* run_result);

// Routes `gridrun` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => pipeline document failed validation
//   30 => one or more jobs failed
//   40 => run cancelled before completion, no job failed
int Dispatch(int argc, char** argv);

} // namespace gridrun::cli
