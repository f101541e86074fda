#pragma once

namespace gridrun::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values keep conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values let wrappers tell a broken pipeline document apart from
// jobs that ran and failed, and from a run that was aborted.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kSchemaInvalid = 10,
  kJobsFailed = 30,
  kCancelled = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace gridrun::core::errors
