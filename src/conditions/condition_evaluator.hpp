#pragma once

#include "conditions/expression.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gridrun::conditions {

// Outcome of a finished step as exposed to `steps.<id>`. Values use the report
// vocabulary: `succeeded`, `failed`, `skipped`. A tolerated failure has
// outcome `failed` and conclusion `succeeded`.
struct StepRecord {
  std::string outcome;
  std::string conclusion;
};

// Everything an expression may read. The evaluator never mutates it; the step
// executor rebuilds the step table between steps.
struct EvaluationContext {
  Value matrix = core::json::MakeObject();
  Value inputs = core::json::MakeObject();
  std::map<std::string, std::string> env;
  std::map<std::string, StepRecord> steps;
  std::string runner_os;
  std::string runner_arch;
  std::string runner_name;

  // A fatal-policy step of this job has failed.
  bool job_failed = false;
  // Cancellation was requested for this job (fail-fast or pipeline abort).
  bool cancelled = false;

  // Strict mode turns missing properties into errors instead of null. The job
  // planner resolves runner labels this way.
  bool strict = false;
};

// `success`, `failure` or `cancelled`, as seen by `job.status`.
std::string JobStatusText(const EvaluationContext& context);

// Evaluates a parsed expression to a value.
bool EvaluateExpression(const ExpressionNode& root, const EvaluationContext& context,
                        Value& result, std::string& error);

// Parses and evaluates `condition`, reducing the value to a boolean.
bool EvaluateCondition(std::string_view condition, const EvaluationContext& context,
                       bool& result, std::string& error);

// Replaces each `${{ expr }}` in `text` with the text of its value.
bool Interpolate(std::string_view text, const EvaluationContext& context, std::string& output,
                 std::string& error);

enum class GateReason {
  kRun,
  kConditionFalse,
  kPriorFailure,
  kCancelled,
  kConditionError,
};

const char* ToString(GateReason reason);

// Whether one step should run, and why not.
struct StepGate {
  bool run = false;
  GateReason reason = GateReason::kRun;
  std::string diagnostic;
};

// Applies the step gating rules:
// - no condition means success();
// - a condition that calls none of success()/failure()/always()/cancelled()
//   is evaluated as `success() && (condition)`;
// - a malformed condition skips the step and reports why.
StepGate EvaluateStepGate(const std::optional<std::string>& condition,
                          const EvaluationContext& context);

} // namespace gridrun::conditions
