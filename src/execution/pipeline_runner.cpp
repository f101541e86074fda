#include "execution/pipeline_runner.hpp"

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace gridrun::execution {

namespace {

struct QueuedJob {
  std::size_t plan_index = 0;
  // Position in the result, which follows plan order.
  std::size_t slot = 0;
  const planner::ExecutableJob* job = nullptr;
};

// Shared scheduling state. Every member is guarded by `mutex`.
struct Scheduler {
  std::mutex mutex;
  std::condition_variable slot_freed;
  std::vector<QueuedJob> pending;
  std::vector<std::size_t> running_per_plan;
  std::vector<std::size_t> limit_per_plan;
  bool abort_reported = false;

  // Takes the first pending job whose template has a free slot.
  bool TryTake(QueuedJob& out) {
    for (auto it = pending.begin(); it != pending.end(); ++it) {
      if (running_per_plan[it->plan_index] < limit_per_plan[it->plan_index]) {
        out = *it;
        pending.erase(it);
        ++running_per_plan[out.plan_index];
        return true;
      }
    }
    return false;
  }
};

std::size_t ResolveWorkerCount(std::size_t requested, std::size_t job_count) {
  std::size_t workers = requested;
  if (workers == 0U) {
    workers = std::max<std::size_t>(1U, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1U, std::min(workers, job_count));
}

} // namespace

PipelineResult RunPipeline(const std::vector<planner::JobPlan>& plans, IActionRunner& runner,
                           const CancellationToken& abort, const PipelineRunOptions& options) {
  PipelineResult result;

  Scheduler scheduler;
  std::vector<std::unique_ptr<CancellationToken>> template_tokens;
  std::vector<bool> fail_fast;
  std::size_t job_count = 0;
  for (std::size_t p = 0; p < plans.size(); ++p) {
    const planner::JobPlan& plan = plans[p];
    template_tokens.push_back(std::make_unique<CancellationToken>(&abort));
    fail_fast.push_back(options.fail_fast_override.value_or(plan.fail_fast));
    scheduler.running_per_plan.push_back(0U);
    scheduler.limit_per_plan.push_back(
        plan.max_parallel.has_value() ? static_cast<std::size_t>(plan.max_parallel.value())
                                      : plan.jobs.size());
    for (const auto& job : plan.jobs) {
      scheduler.pending.push_back({.plan_index = p, .slot = job_count++, .job = &job});
    }
    result.unplannable.insert(result.unplannable.end(), plan.unplannable.begin(),
                              plan.unplannable.end());
  }

  std::vector<std::optional<JobOutcome>> outcomes(job_count);

  auto report_cancel = [&options](std::string_view scope, std::string_view reason) {
    if (options.logger != nullptr) {
      options.logger->Warn("cancellation requested", {{"scope", scope}, {"reason", reason}});
    }
    if (options.on_cancel_requested) {
      options.on_cancel_requested(scope, reason);
    }
  };

  auto check_abort = [&]() {
    if (!abort.IsCancelled()) {
      return;
    }
    {
      const std::lock_guard<std::mutex> lock(scheduler.mutex);
      if (scheduler.abort_reported) {
        return;
      }
      scheduler.abort_reported = true;
    }
    report_cancel("pipeline", "abort requested");
  };

  auto worker = [&]() {
    while (true) {
      QueuedJob queued;
      {
        std::unique_lock<std::mutex> lock(scheduler.mutex);
        scheduler.slot_freed.wait(lock, [&]() {
          return scheduler.pending.empty() || scheduler.TryTake(queued);
        });
        if (queued.job == nullptr) {
          return;
        }
      }
      check_abort();

      const planner::ExecutableJob& job = *queued.job;
      const CancellationToken& token = *template_tokens[queued.plan_index];

      std::optional<core::logging::Logger> job_logger;
      StepExecutorOptions step_options;
      step_options.log_dir = options.log_dir;
      step_options.observer = options.observer;
      if (options.logger != nullptr) {
        job_logger.emplace(options.logger->ForJob(job.id));
        step_options.logger = &job_logger.value();
        job_logger->Info("job started",
                         {{"name", job.display_name}, {"runner", job.runner_label}});
      }

      JobOutcome outcome = ExecuteJob(job, runner, token, step_options);

      if (job_logger.has_value()) {
        job_logger->Info("job finished", {{"status", ToString(outcome.status)},
                                          {"duration_ms", std::to_string(outcome.duration_ms)}});
      }
      check_abort();
      if (outcome.status == JobStatus::kFailed && fail_fast[queued.plan_index] &&
          template_tokens[queued.plan_index]->Cancel()) {
        report_cancel(job.template_name, "fail-fast after " + job.id + " failed");
      }

      {
        const std::lock_guard<std::mutex> lock(scheduler.mutex);
        outcomes[queued.slot] = std::move(outcome);
        --scheduler.running_per_plan[queued.plan_index];
      }
      scheduler.slot_freed.notify_all();
    }
  };

  const std::size_t worker_count = ResolveWorkerCount(options.max_parallel, job_count);
  if (job_count > 0U) {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
      thread.join();
    }
  }

  bool any_template_cancelled = false;
  for (const auto& token : template_tokens) {
    any_template_cancelled = any_template_cancelled || token->IsCancelled();
  }
  result.cancelled = abort.IsCancelled() || any_template_cancelled;

  for (auto& outcome : outcomes) {
    if (!outcome.has_value()) {
      continue;
    }
    switch (outcome->status) {
    case JobStatus::kSucceeded:
      ++result.succeeded_count;
      break;
    case JobStatus::kFailed:
      ++result.failed_count;
      break;
    case JobStatus::kCancelled:
      ++result.cancelled_count;
      break;
    default:
      break;
    }
    result.jobs.push_back(std::move(outcome.value()));
  }
  result.success = result.failed_count == 0U;
  return result;
}

} // namespace gridrun::execution
