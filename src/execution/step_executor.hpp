#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "execution/action_runner.hpp"
#include "execution/cancellation.hpp"
#include "planner/job_planner.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gridrun::execution {

enum class StepStatus {
  kPending,
  kSkipped,
  kRunning,
  kSucceeded,
  kFailed,
};

enum class SkipReason {
  kNone,
  kCondition,
  kPriorFailure,
  kCancelled,
  kConditionError,
  kPlatform,
};

enum class JobStatus {
  kPending,
  kRunning,
  kSucceeded,
  kFailed,
  kCancelled,
};

const char* ToString(StepStatus status);
const char* ToString(SkipReason reason);
const char* ToString(JobStatus status);

struct StepResult {
  std::size_t index = 0;
  std::string id;
  std::string name;
  std::string action;
  planner::FailurePolicy policy = planner::FailurePolicy::kFatal;
  StepStatus status = StepStatus::kPending;
  SkipReason skip_reason = SkipReason::kNone;
  // Unset when the step never ran or could not be launched.
  std::optional<int> exit_code;
  std::int64_t duration_ms = 0;
  // Condition errors, launch failures, interpolation errors, runner notes.
  std::string diagnostic;
  std::filesystem::path log_path;
};

struct JobOutcome {
  std::string job_id;
  std::string template_name;
  std::string display_name;
  core::json::Value matrix = core::json::MakeObject();
  std::string runner_label;
  std::string runner_os;
  JobStatus status = JobStatus::kPending;
  std::vector<StepResult> steps;
  // Index of the first failed fatal step.
  std::optional<std::size_t> stopped_at;
  std::size_t tolerated_failures = 0;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::int64_t duration_ms = 0;
  std::vector<std::string> diagnostics;
};

// Progress callbacks. Called on the job's worker thread; implementations
// shared across jobs must synchronize themselves.
class IStepObserver {
public:
  virtual ~IStepObserver() = default;

  virtual void OnJobStarted(const planner::ExecutableJob& job) = 0;
  virtual void OnStepStarted(const planner::ExecutableJob& job, const planner::PlannedStep& step) = 0;
  virtual void OnStepFinished(const planner::ExecutableJob& job, const StepResult& result) = 0;
  virtual void OnJobFinished(const JobOutcome& outcome) = 0;
};

struct StepExecutorOptions {
  // Per-step logs go to `<log_dir>/<job-id>/<NN>.log`. Empty disables them.
  std::filesystem::path log_dir;
  const core::logging::Logger* logger = nullptr;
  IStepObserver* observer = nullptr;
};

// Runs one job's steps strictly in declared order.
//
// Contract:
// - a step whose `platforms` guard excludes the runner OS is skipped;
// - every other step is gated by its condition (implicit success() guard);
// - a failed fatal step sets `stopped_at` and fails the job; later steps
//   only run when their condition opts out of the guard (always(), failure());
// - a failed tolerant step is counted and never fails the job by itself;
// - cancellation is read before each step; a running step always finishes;
// - no retries.
JobOutcome ExecuteJob(const planner::ExecutableJob& job, IActionRunner& runner,
                      const CancellationToken& cancellation,
                      const StepExecutorOptions& options = {});

} // namespace gridrun::execution
