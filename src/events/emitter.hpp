#pragma once

#include "core/logging/logger.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"
#include "execution/pipeline_runner.hpp"
#include "execution/step_executor.hpp"
#include "planner/job_planner.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace gridrun::events {

// Event facade used by run orchestration to keep payload contracts consistent
// across the JSONL timeline. Doubles as the step observer handed to the
// pipeline runner, so job workers emit through it directly.
//
// Observer callbacks cannot return errors; the first write failure is kept
// and reported through `first_error()` (and the logger, when one is set).
class Emitter final : public execution::IStepObserver {
public:
  Emitter(JsonlEventWriter& writer, std::string run_id,
          const core::logging::Logger* logger = nullptr);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitPipelineStarted(std::string_view pipeline_id, std::string_view action_runner,
                           std::size_t planned_jobs, std::size_t unplannable_jobs,
                           std::string& error);
  bool EmitJobPlanned(const planner::ExecutableJob& job, std::string& error);
  bool EmitJobUnplannable(const planner::UnplannableJob& job, std::string& error);
  bool EmitCancelRequested(std::string_view scope, std::string_view reason, std::string& error);
  bool EmitPipelineFinished(const execution::PipelineResult& result, std::string& error);

  void OnJobStarted(const planner::ExecutableJob& job) override;
  void OnStepStarted(const planner::ExecutableJob& job, const planner::PlannedStep& step) override;
  void OnStepFinished(const planner::ExecutableJob& job,
                      const execution::StepResult& result) override;
  void OnJobFinished(const execution::JobOutcome& outcome) override;

  std::string first_error() const;

private:
  void Record(const std::string& error);

  JsonlEventWriter& writer_;
  std::string run_id_;
  const core::logging::Logger* logger_ = nullptr;
  mutable std::mutex error_mutex_;
  std::string first_error_;
};

} // namespace gridrun::events
