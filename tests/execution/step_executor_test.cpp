#include "execution/cancellation.hpp"
#include "execution/dry_run_action_runner.hpp"
#include "execution/step_executor.hpp"
#include "execution/testing/scripted_action_runner.hpp"
#include "pipeline/model.hpp"
#include "planner/job_planner.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

using gridrun::execution::CancellationToken;
using gridrun::execution::ExecuteJob;
using gridrun::execution::JobOutcome;
using gridrun::execution::JobStatus;
using gridrun::execution::SkipReason;
using gridrun::execution::StepStatus;
using gridrun::execution::testing::ScriptedActionRunner;

namespace {

// Plans the first template of `json` and returns its first job.
gridrun::planner::ExecutableJob PlanSingleJob(std::string_view json, std::size_t index = 0) {
  gridrun::pipeline::PipelineModel model;
  std::string error;
  const bool parsed = gridrun::pipeline::ParsePipelineModelText(json, model, error);
  INFO(error);
  REQUIRE(parsed);
  gridrun::planner::JobPlan plan = gridrun::planner::PlanTemplate(model, model.jobs.front());
  REQUIRE(plan.jobs.size() > index);
  return plan.jobs[index];
}

std::vector<StepStatus> Statuses(const JobOutcome& outcome) {
  std::vector<StepStatus> statuses;
  for (const auto& step : outcome.steps) {
    statuses.push_back(step.status);
  }
  return statuses;
}

// Records observer callbacks in arrival order.
class RecordingObserver final : public gridrun::execution::IStepObserver {
public:
  void OnJobStarted(const gridrun::planner::ExecutableJob& job) override {
    events.push_back("job_started:" + job.id);
  }
  void OnStepStarted(const gridrun::planner::ExecutableJob& job,
                     const gridrun::planner::PlannedStep& step) override {
    (void)job;
    events.push_back("step_started:" + std::to_string(step.index));
  }
  void OnStepFinished(const gridrun::planner::ExecutableJob& job,
                      const gridrun::execution::StepResult& result) override {
    (void)job;
    events.push_back("step_finished:" + std::to_string(result.index) + ":" +
                     gridrun::execution::ToString(result.status));
  }
  void OnJobFinished(const JobOutcome& outcome) override {
    events.push_back(std::string("job_finished:") + gridrun::execution::ToString(outcome.status));
  }

  std::vector<std::string> events;
};

} // namespace

TEST_CASE("A fatal failure skips later guarded steps and fails the job", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"run": "step-one"},
      {"run": "step-two", "continue-on-error": true},
      {"run": "step-three"}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetExitCode("step-one", 1);
  CancellationToken token;

  const JobOutcome outcome = ExecuteJob(job, runner, token);
  REQUIRE(Statuses(outcome) ==
          std::vector<StepStatus>{StepStatus::kFailed, StepStatus::kSkipped, StepStatus::kSkipped});
  REQUIRE(outcome.steps[1].skip_reason == SkipReason::kPriorFailure);
  REQUIRE(outcome.steps[2].skip_reason == SkipReason::kPriorFailure);
  REQUIRE(outcome.status == JobStatus::kFailed);
  REQUIRE(outcome.stopped_at == 0U);
  REQUIRE(outcome.steps[0].exit_code == 1);
  REQUIRE(runner.calls().size() == 1U);
}

TEST_CASE("A tolerant failure is recorded without failing the job", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"id": "lint", "run": "lint", "continue-on-error": true},
      {"run": "test"},
      {"run": "report", "if": "steps.lint.outcome == 'failed' && steps.lint.conclusion == 'succeeded'"}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetExitCode("lint", 2);
  CancellationToken token;

  const JobOutcome outcome = ExecuteJob(job, runner, token);
  REQUIRE(Statuses(outcome) == std::vector<StepStatus>{StepStatus::kFailed, StepStatus::kSucceeded,
                                                       StepStatus::kSucceeded});
  REQUIRE(outcome.status == JobStatus::kSucceeded);
  REQUIRE(outcome.tolerated_failures == 1U);
  REQUIRE_FALSE(outcome.stopped_at.has_value());
}

TEST_CASE("always() and failure() steps run after a fatal failure", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"id": "build", "run": "build"},
      {"run": "test"},
      {"run": "collect-logs", "if": "always()"},
      {"run": "notify", "if": "failure() && steps.build.outcome == 'failed'"},
      {"run": "celebrate", "if": "success()"}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetExitCode("build", 1);
  CancellationToken token;

  const JobOutcome outcome = ExecuteJob(job, runner, token);
  REQUIRE(Statuses(outcome) ==
          std::vector<StepStatus>{StepStatus::kFailed, StepStatus::kSkipped, StepStatus::kSucceeded,
                                  StepStatus::kSucceeded, StepStatus::kSkipped});
  REQUIRE(outcome.steps[4].skip_reason == SkipReason::kCondition);
  REQUIRE(outcome.status == JobStatus::kFailed);
  REQUIRE(runner.scripts_for_job(job.id) ==
          std::vector<std::string>{"build", "collect-logs", "notify"});
}

TEST_CASE("A failing always() step after a fatal failure keeps the first stop point",
          "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"run": "build"},
      {"run": "cleanup", "if": "always()"}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetExitCode("build", 1);
  runner.SetExitCode("cleanup", 3);
  CancellationToken token;

  const JobOutcome outcome = ExecuteJob(job, runner, token);
  REQUIRE(outcome.status == JobStatus::kFailed);
  REQUIRE(outcome.stopped_at == 0U);
  REQUIRE(outcome.steps[1].status == StepStatus::kFailed);
}

TEST_CASE("Conditions read matrix values and malformed ones skip the step",
          "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest",
      "strategy": {"matrix": {"python": ["3.12"]}},
      "steps": [
        {"run": "only-on-311", "if": "matrix.python == '3.11'"},
        {"run": "broken", "if": "matrix.python =="},
        {"run": "after"}
      ]}}
  })JSON");

  ScriptedActionRunner runner;
  CancellationToken token;
  const JobOutcome outcome = ExecuteJob(job, runner, token);

  REQUIRE(outcome.steps[0].status == StepStatus::kSkipped);
  REQUIRE(outcome.steps[0].skip_reason == SkipReason::kCondition);
  REQUIRE(outcome.steps[1].status == StepStatus::kSkipped);
  REQUIRE(outcome.steps[1].skip_reason == SkipReason::kConditionError);
  REQUIRE_FALSE(outcome.steps[1].diagnostic.empty());
  REQUIRE(outcome.steps[2].status == StepStatus::kSucceeded);
  REQUIRE(outcome.status == JobStatus::kSucceeded);
}

TEST_CASE("Platform guards skip steps that do not apply to the runner", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "macos-latest", "steps": [
      {"run": "apt-get install", "platforms": ["Linux"]},
      {"run": "brew install", "platforms": ["linux", "MACOS"]}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  CancellationToken token;
  const JobOutcome outcome = ExecuteJob(job, runner, token);

  REQUIRE(outcome.steps[0].status == StepStatus::kSkipped);
  REQUIRE(outcome.steps[0].skip_reason == SkipReason::kPlatform);
  REQUIRE(outcome.steps[1].status == StepStatus::kSucceeded);
}

TEST_CASE("Scripts are interpolated when the step is reached", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "actions": {"greet": {"run": "echo hello ${{ inputs.who }}"}},
    "jobs": {"t": {"runs-on": "ubuntu-latest",
      "strategy": {"matrix": {"python": ["3.12"]}},
      "steps": [
        {"id": "first", "run": "exit 1", "continue-on-error": true},
        {"run": "echo first was ${{ steps.first.outcome }} on ${{ matrix.python }}"},
        {"uses": "greet", "with": {"who": "py${{ matrix.python }}"}}
      ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetExitCode("exit 1", 1);
  CancellationToken token;
  const JobOutcome outcome = ExecuteJob(job, runner, token);

  REQUIRE(outcome.status == JobStatus::kSucceeded);
  REQUIRE(runner.scripts_for_job(job.id) ==
          std::vector<std::string>{"exit 1", "echo first was failed on 3.12",
                                   "echo hello py3.12"});
}

TEST_CASE("Unregistered actions and launch failures fail the step", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"uses": "does-not-exist", "continue-on-error": true},
      {"run": "cannot-launch"}
    ]}}
  })JSON");

  ScriptedActionRunner runner;
  runner.SetLaunchFailure("cannot-launch", "shell missing");
  CancellationToken token;
  const JobOutcome outcome = ExecuteJob(job, runner, token);

  REQUIRE(outcome.steps[0].status == StepStatus::kFailed);
  REQUIRE(outcome.steps[0].diagnostic.find("not registered") != std::string::npos);
  REQUIRE_FALSE(outcome.steps[0].exit_code.has_value());
  REQUIRE(outcome.steps[1].status == StepStatus::kFailed);
  REQUIRE(outcome.steps[1].diagnostic.find("shell missing") != std::string::npos);
  REQUIRE(outcome.status == JobStatus::kFailed);
  REQUIRE(runner.calls().size() == 1U);
}

TEST_CASE("Cancellation is observed at step boundaries", "[execution][steps][cancel]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"run": "first"},
      {"run": "second"},
      {"run": "teardown", "if": "cancelled() || always()"}
    ]}}
  })JSON");

  CancellationToken token;
  ScriptedActionRunner runner;
  // The running step finishes even though cancellation arrives mid-step.
  runner.SetHook([&token](const gridrun::execution::ActionRequest& request) {
    if (request.script == "first") {
      (void)token.Cancel();
    }
  });

  const JobOutcome outcome = ExecuteJob(job, runner, token);
  REQUIRE(outcome.steps[0].status == StepStatus::kSucceeded);
  REQUIRE(outcome.steps[1].status == StepStatus::kSkipped);
  REQUIRE(outcome.steps[1].skip_reason == SkipReason::kCancelled);
  REQUIRE(outcome.steps[2].status == StepStatus::kSucceeded);
  REQUIRE(outcome.status == JobStatus::kCancelled);
}

TEST_CASE("A child token reports its parent's cancellation", "[execution][cancel]") {
  CancellationToken parent;
  CancellationToken child(&parent);
  REQUIRE_FALSE(child.IsCancelled());
  REQUIRE(parent.Cancel());
  REQUIRE_FALSE(parent.Cancel());
  REQUIRE(child.IsCancelled());
  REQUIRE(child.Cancel());
}

TEST_CASE("Observers see job and step lifecycle in order", "[execution][steps]") {
  const auto job = PlanSingleJob(R"JSON({
    "schema_version": "1.0", "pipeline_id": "p",
    "jobs": {"t": {"runs-on": "ubuntu-latest", "steps": [
      {"run": "a", "if": "false"},
      {"run": "b"}
    ]}}
  })JSON");

  gridrun::execution::DryRunActionRunner runner;
  CancellationToken token;
  RecordingObserver observer;
  gridrun::execution::StepExecutorOptions options;
  options.observer = &observer;

  const JobOutcome outcome = ExecuteJob(job, runner, token, options);
  REQUIRE(outcome.status == JobStatus::kSucceeded);
  REQUIRE(outcome.steps[1].diagnostic.find("dry run") != std::string::npos);
  REQUIRE(observer.events == std::vector<std::string>{
                                 "job_started:t-001",
                                 "step_finished:0:skipped",
                                 "step_started:1",
                                 "step_finished:1:succeeded",
                                 "job_finished:succeeded",
                             });
}
