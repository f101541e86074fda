#include "events/emitter.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <utility>

namespace gridrun::events {

namespace {

std::chrono::system_clock::time_point Now() {
  return std::chrono::system_clock::now();
}

} // namespace

Emitter::Emitter(JsonlEventWriter& writer, std::string run_id, const core::logging::Logger* logger)
    : writer_(writer), run_id_(std::move(run_id)), logger_(logger) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  event.payload["run_id"] = run_id_;
  return writer_.Append(event, error);
}

bool Emitter::EmitPipelineStarted(std::string_view pipeline_id, std::string_view action_runner,
                                  std::size_t planned_jobs, std::size_t unplannable_jobs,
                                  std::string& error) {
  return EmitRaw(EventType::kPipelineStarted, Now(),
                 {
                     {"pipeline_id", std::string(pipeline_id)},
                     {"action_runner", std::string(action_runner)},
                     {"planned_jobs", std::to_string(planned_jobs)},
                     {"unplannable_jobs", std::to_string(unplannable_jobs)},
                 },
                 error);
}

bool Emitter::EmitJobPlanned(const planner::ExecutableJob& job, std::string& error) {
  return EmitRaw(EventType::kJobPlanned, Now(),
                 {
                     {"job_id", job.id},
                     {"template", job.template_name},
                     {"name", job.display_name},
                     {"matrix", core::json::Serialize(job.matrix)},
                     {"runner_label", job.runner_label},
                     {"runner_os", job.runner.os},
                     {"step_count", std::to_string(job.steps.size())},
                 },
                 error);
}

bool Emitter::EmitJobUnplannable(const planner::UnplannableJob& job, std::string& error) {
  return EmitRaw(EventType::kJobUnplannable, Now(),
                 {
                     {"job_id", job.id},
                     {"template", job.template_name},
                     {"name", job.display_name},
                     {"matrix", core::json::Serialize(job.combination.ToObject())},
                     {"reason", job.reason},
                 },
                 error);
}

bool Emitter::EmitCancelRequested(std::string_view scope, std::string_view reason,
                                  std::string& error) {
  return EmitRaw(EventType::kCancelRequested, Now(),
                 {
                     {"scope", std::string(scope)},
                     {"reason", std::string(reason)},
                 },
                 error);
}

bool Emitter::EmitPipelineFinished(const execution::PipelineResult& result, std::string& error) {
  return EmitRaw(EventType::kPipelineFinished, Now(),
                 {
                     {"success", core::JsonBool(result.success)},
                     {"cancelled", core::JsonBool(result.cancelled)},
                     {"succeeded_jobs", std::to_string(result.succeeded_count)},
                     {"failed_jobs", std::to_string(result.failed_count)},
                     {"cancelled_jobs", std::to_string(result.cancelled_count)},
                     {"unplannable_jobs", std::to_string(result.unplannable.size())},
                 },
                 error);
}

void Emitter::OnJobStarted(const planner::ExecutableJob& job) {
  std::string error;
  if (!EmitRaw(EventType::kJobStarted, Now(),
               {{"job_id", job.id}, {"name", job.display_name}, {"runner_label", job.runner_label}},
               error)) {
    Record(error);
  }
}

void Emitter::OnStepStarted(const planner::ExecutableJob& job, const planner::PlannedStep& step) {
  std::string error;
  if (!EmitRaw(EventType::kStepStarted, Now(),
               {
                   {"job_id", job.id},
                   {"step_index", std::to_string(step.index)},
                   {"step_id", step.id},
                   {"name", step.display_name},
                   {"action", step.action},
                   {"policy", planner::ToString(step.policy)},
               },
               error)) {
    Record(error);
  }
}

void Emitter::OnStepFinished(const planner::ExecutableJob& job,
                             const execution::StepResult& result) {
  std::map<std::string, std::string> payload = {
      {"job_id", job.id},
      {"step_index", std::to_string(result.index)},
      {"step_id", result.id},
      {"name", result.name},
      {"status", execution::ToString(result.status)},
      {"policy", planner::ToString(result.policy)},
      {"duration_ms", std::to_string(result.duration_ms)},
  };
  if (result.status == execution::StepStatus::kSkipped) {
    payload["skip_reason"] = execution::ToString(result.skip_reason);
  }
  if (result.exit_code.has_value()) {
    payload["exit_code"] = std::to_string(result.exit_code.value());
  }
  if (!result.diagnostic.empty()) {
    payload["diagnostic"] = result.diagnostic;
  }

  std::string error;
  if (!EmitRaw(EventType::kStepFinished, Now(), std::move(payload), error)) {
    Record(error);
  }
}

void Emitter::OnJobFinished(const execution::JobOutcome& outcome) {
  std::map<std::string, std::string> payload = {
      {"job_id", outcome.job_id},
      {"status", execution::ToString(outcome.status)},
      {"duration_ms", std::to_string(outcome.duration_ms)},
      {"tolerated_failures", std::to_string(outcome.tolerated_failures)},
  };
  if (outcome.stopped_at.has_value()) {
    payload["stopped_at"] = std::to_string(outcome.stopped_at.value());
  }

  std::string error;
  if (!EmitRaw(EventType::kJobFinished, outcome.finished_at, std::move(payload), error)) {
    Record(error);
  }
}

std::string Emitter::first_error() const {
  const std::lock_guard<std::mutex> lock(error_mutex_);
  return first_error_;
}

void Emitter::Record(const std::string& error) {
  {
    const std::lock_guard<std::mutex> lock(error_mutex_);
    if (!first_error_.empty()) {
      return;
    }
    first_error_ = error;
  }
  if (logger_ != nullptr) {
    logger_->Warn("event write failed", {{"error", error}});
  }
}

} // namespace gridrun::events
