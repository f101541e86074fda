#pragma once

#include "core/logging/logger.hpp"
#include "execution/action_runner.hpp"
#include "execution/cancellation.hpp"
#include "execution/step_executor.hpp"
#include "planner/job_planner.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridrun::execution {

struct PipelineRunOptions {
  // Worker threads. 0 means hardware concurrency; always capped by job count.
  std::size_t max_parallel = 0;
  // Overrides every template's `strategy.fail-fast` when set.
  std::optional<bool> fail_fast_override;
  std::filesystem::path log_dir;
  const core::logging::Logger* logger = nullptr;
  IStepObserver* observer = nullptr;
  // Called once per cancellation scope: `pipeline` or a template name.
  std::function<void(std::string_view scope, std::string_view reason)> on_cancel_requested;
};

struct PipelineResult {
  // Plan order, independent of completion order.
  std::vector<JobOutcome> jobs;
  std::vector<planner::UnplannableJob> unplannable;
  // No job failed. Unplannable jobs do not count.
  bool success = true;
  // Cancellation was requested (abort or fail-fast) during the run.
  bool cancelled = false;
  std::size_t succeeded_count = 0;
  std::size_t failed_count = 0;
  std::size_t cancelled_count = 0;
};

// Runs every planned job on a pool of worker threads.
//
// Contract:
// - each job runs on one worker; steps within a job never overlap;
// - a template's `max_parallel` caps its concurrently running jobs;
// - `abort` is the pipeline-wide token (signals, caller request); each
//   template gets a child token that fail-fast cancels when one of its jobs
//   fails;
// - jobs started after their token is cancelled are still walked so that
//   always()/cancelled() steps run.
PipelineResult RunPipeline(const std::vector<planner::JobPlan>& plans, IActionRunner& runner,
                           const CancellationToken& abort, const PipelineRunOptions& options = {});

} // namespace gridrun::execution
