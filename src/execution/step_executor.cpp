#include "execution/step_executor.hpp"

#include "conditions/condition_evaluator.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace gridrun::execution {

namespace {

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

bool PlatformAllows(const planner::PlannedStep& step, std::string_view runner_os) {
  if (step.platforms.empty()) {
    return true;
  }
  return std::any_of(step.platforms.begin(), step.platforms.end(),
                     [runner_os](const std::string& os) { return EqualsIgnoreCase(os, runner_os); });
}

SkipReason ToSkipReason(conditions::GateReason reason) {
  switch (reason) {
  case conditions::GateReason::kConditionFalse:
    return SkipReason::kCondition;
  case conditions::GateReason::kPriorFailure:
    return SkipReason::kPriorFailure;
  case conditions::GateReason::kCancelled:
    return SkipReason::kCancelled;
  case conditions::GateReason::kConditionError:
    return SkipReason::kConditionError;
  case conditions::GateReason::kRun:
    break;
  }
  return SkipReason::kNone;
}

std::filesystem::path StepLogPath(const std::filesystem::path& log_dir, const std::string& job_id,
                                  std::size_t index) {
  if (log_dir.empty()) {
    return {};
  }
  char name[32];
  std::snprintf(name, sizeof(name), "%02zu.log", index + 1U);
  return log_dir / job_id / name;
}

// `steps.<id>` view of a finished step.
conditions::StepRecord MakeRecord(const StepResult& result) {
  switch (result.status) {
  case StepStatus::kSucceeded:
    return {.outcome = "succeeded", .conclusion = "succeeded"};
  case StepStatus::kFailed:
    return {.outcome = "failed",
            .conclusion = result.policy == planner::FailurePolicy::kTolerant ? "succeeded"
                                                                             : "failed"};
  default:
    return {.outcome = "skipped", .conclusion = "skipped"};
  }
}

void RunStep(const planner::ExecutableJob& job, const planner::PlannedStep& step,
             IActionRunner& runner, conditions::EvaluationContext& context,
             const StepExecutorOptions& options, StepResult& result) {
  const auto started = std::chrono::steady_clock::now();
  result.status = StepStatus::kRunning;

  auto fail = [&result](std::string diagnostic) {
    result.status = StepStatus::kFailed;
    result.diagnostic = std::move(diagnostic);
  };

  if (!step.plan_error.empty()) {
    fail(step.plan_error);
  } else {
    ActionRequest request;
    request.job_id = job.id;
    request.step_index = step.index;
    request.step_name = step.display_name;
    request.action = step.action;
    request.shell = step.shell;
    request.env = step.env;
    request.working_directory = step.working_directory;
    request.log_path = result.log_path;

    // The script may read `steps.<id>` and `inputs.<name>`, so it is
    // interpolated only now.
    context.inputs = step.inputs;
    std::string error;
    if (!conditions::Interpolate(step.script, context, request.script, error)) {
      fail("script interpolation failed: " + error);
    } else {
      ActionResult action_result;
      if (!runner.Run(request, action_result, error)) {
        fail("action could not be launched: " + error);
      } else {
        result.exit_code = action_result.exit_code;
        result.diagnostic = action_result.note;
        result.status =
            action_result.exit_code == 0 ? StepStatus::kSucceeded : StepStatus::kFailed;
      }
    }
    context.inputs = core::json::MakeObject();
  }

  result.duration_ms = core::ElapsedMs(started, std::chrono::steady_clock::now());
  if (options.logger == nullptr) {
    return;
  }
  const std::string index_text = std::to_string(step.index);
  const std::string duration_text = std::to_string(result.duration_ms);
  const std::string exit_text =
      result.exit_code.has_value() ? std::to_string(result.exit_code.value()) : "-";
  if (result.status == StepStatus::kSucceeded) {
    options.logger->Info("step succeeded", {{"step", result.name},
                                            {"index", index_text},
                                            {"duration_ms", duration_text}});
  } else {
    options.logger->Warn("step failed", {{"step", result.name},
                                         {"index", index_text},
                                         {"policy", planner::ToString(step.policy)},
                                         {"exit_code", exit_text},
                                         {"detail", result.diagnostic}});
  }
}

} // namespace

const char* ToString(StepStatus status) {
  switch (status) {
  case StepStatus::kPending:
    return "pending";
  case StepStatus::kSkipped:
    return "skipped";
  case StepStatus::kRunning:
    return "running";
  case StepStatus::kSucceeded:
    return "succeeded";
  case StepStatus::kFailed:
    return "failed";
  }
  return "unknown";
}

const char* ToString(SkipReason reason) {
  switch (reason) {
  case SkipReason::kNone:
    return "none";
  case SkipReason::kCondition:
    return "condition";
  case SkipReason::kPriorFailure:
    return "prior_failure";
  case SkipReason::kCancelled:
    return "cancelled";
  case SkipReason::kConditionError:
    return "condition_error";
  case SkipReason::kPlatform:
    return "platform";
  }
  return "unknown";
}

const char* ToString(JobStatus status) {
  switch (status) {
  case JobStatus::kPending:
    return "pending";
  case JobStatus::kRunning:
    return "running";
  case JobStatus::kSucceeded:
    return "succeeded";
  case JobStatus::kFailed:
    return "failed";
  case JobStatus::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

JobOutcome ExecuteJob(const planner::ExecutableJob& job, IActionRunner& runner,
                      const CancellationToken& cancellation, const StepExecutorOptions& options) {
  JobOutcome outcome;
  outcome.job_id = job.id;
  outcome.template_name = job.template_name;
  outcome.display_name = job.display_name;
  outcome.matrix = job.matrix;
  outcome.runner_label = job.runner_label;
  outcome.runner_os = job.runner.os;
  outcome.diagnostics = job.diagnostics;
  outcome.status = JobStatus::kRunning;
  outcome.started_at = std::chrono::system_clock::now();
  const auto started = std::chrono::steady_clock::now();

  if (options.observer != nullptr) {
    options.observer->OnJobStarted(job);
  }

  conditions::EvaluationContext context;
  context.matrix = job.matrix;
  context.env = job.env;
  context.runner_os = job.runner.os;
  context.runner_arch = job.runner.arch;
  context.runner_name = job.runner_label;

  bool cancel_observed = false;
  for (const auto& step : job.steps) {
    context.cancelled = cancellation.IsCancelled();
    if (context.cancelled && !cancel_observed) {
      cancel_observed = true;
      if (options.logger != nullptr) {
        options.logger->Info("cancellation observed",
                             {{"next_step_index", std::to_string(step.index)}});
      }
    }

    StepResult result;
    result.index = step.index;
    result.id = step.id;
    result.name = step.display_name;
    result.action = step.action;
    result.policy = step.policy;

    if (!PlatformAllows(step, job.runner.os)) {
      result.status = StepStatus::kSkipped;
      result.skip_reason = SkipReason::kPlatform;
      result.diagnostic = "step does not apply to runner OS '" + job.runner.os + "'";
    } else {
      const conditions::StepGate gate = conditions::EvaluateStepGate(step.condition, context);
      if (!gate.run) {
        result.status = StepStatus::kSkipped;
        result.skip_reason = ToSkipReason(gate.reason);
        result.diagnostic = gate.diagnostic;
        if (gate.reason == conditions::GateReason::kConditionError && options.logger != nullptr) {
          options.logger->Warn("step condition could not be evaluated; skipping",
                               {{"step", result.name}, {"error", gate.diagnostic}});
        }
      } else {
        result.log_path = StepLogPath(options.log_dir, job.id, step.index);
        if (options.observer != nullptr) {
          options.observer->OnStepStarted(job, step);
        }
        RunStep(job, step, runner, context, options, result);
      }
    }

    if (result.status == StepStatus::kSkipped && options.logger != nullptr) {
      options.logger->Debug("step skipped",
                            {{"step", result.name}, {"reason", ToString(result.skip_reason)}});
    }

    if (result.status == StepStatus::kFailed) {
      if (step.policy == planner::FailurePolicy::kFatal) {
        context.job_failed = true;
        if (!outcome.stopped_at.has_value()) {
          outcome.stopped_at = step.index;
        }
      } else {
        ++outcome.tolerated_failures;
      }
    }

    if (!step.id.empty()) {
      context.steps[step.id] = MakeRecord(result);
    }
    if (options.observer != nullptr) {
      options.observer->OnStepFinished(job, result);
    }
    outcome.steps.push_back(std::move(result));
  }

  if (context.job_failed) {
    outcome.status = JobStatus::kFailed;
  } else if (cancel_observed) {
    outcome.status = JobStatus::kCancelled;
  } else {
    outcome.status = JobStatus::kSucceeded;
  }
  outcome.finished_at = std::chrono::system_clock::now();
  outcome.duration_ms = core::ElapsedMs(started, std::chrono::steady_clock::now());

  if (options.observer != nullptr) {
    options.observer->OnJobFinished(outcome);
  }
  return outcome;
}

} // namespace gridrun::execution
