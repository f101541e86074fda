#include "conditions/condition_evaluator.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>

using gridrun::conditions::EvaluateCondition;
using gridrun::conditions::EvaluateStepGate;
using gridrun::conditions::EvaluationContext;
using gridrun::conditions::GateReason;
using gridrun::conditions::Interpolate;
using gridrun::conditions::StepGate;

namespace {

EvaluationContext MakeContext() {
  EvaluationContext context;
  context.matrix.Set("os", gridrun::core::json::MakeString("ubuntu-latest"));
  context.matrix.Set("python", gridrun::core::json::MakeString("3.12"));
  context.matrix.Set("shard", gridrun::core::json::MakeNumber(2));
  context.env["DEPLOY"] = "yes";
  context.runner_os = "Linux";
  context.runner_arch = "X64";
  context.runner_name = "ubuntu-latest";
  return context;
}

bool Eval(std::string_view condition, const EvaluationContext& context) {
  bool result = false;
  std::string error;
  const bool ok = EvaluateCondition(condition, context, result, error);
  INFO(condition << " -> " << error);
  REQUIRE(ok);
  return result;
}

} // namespace

TEST_CASE("Comparisons read matrix, env and runner contexts", "[conditions]") {
  const EvaluationContext context = MakeContext();
  REQUIRE(Eval("matrix.os == 'ubuntu-latest'", context));
  REQUIRE(Eval("${{ matrix.python != '3.11' }}", context));
  REQUIRE(Eval("env.DEPLOY == 'yes' && runner.os == 'Linux'", context));
  REQUIRE_FALSE(Eval("runner.arch == 'ARM64'", context));
  REQUIRE(Eval("matrix['shard'] >= 2 && matrix.shard < 3", context));
}

TEST_CASE("String equality ignores case and mixed types coerce to numbers", "[conditions]") {
  const EvaluationContext context = MakeContext();
  REQUIRE(Eval("runner.os == 'LINUX'", context));
  REQUIRE(Eval("matrix.shard == '2'", context));
  REQUIRE(Eval("matrix.python > 3.1", context));
  REQUIRE_FALSE(Eval("'abc' == 1", context));
  REQUIRE(Eval("null == 0", context));
  REQUIRE(Eval("true == 1", context));
}

TEST_CASE("Logical operators short-circuit and negate", "[conditions]") {
  const EvaluationContext context = MakeContext();
  REQUIRE(Eval("!(matrix.os == 'windows-latest')", context));
  REQUIRE(Eval("matrix.os == 'macos-latest' || matrix.shard == 2", context));
  REQUIRE_FALSE(Eval("matrix.missing && matrix.missing.deeper", context));
  REQUIRE(Eval("!matrix.missing", context));
}

TEST_CASE("String helper functions are case-insensitive", "[conditions]") {
  const EvaluationContext context = MakeContext();
  REQUIRE(Eval("startsWith(matrix.os, 'UBUNTU')", context));
  REQUIRE(Eval("endsWith(matrix.os, '-latest')", context));
  REQUIRE(Eval("contains(matrix.os, 'Buntu')", context));
  REQUIRE_FALSE(Eval("contains(matrix.os, 'windows')", context));
}

TEST_CASE("format substitutes positional arguments", "[conditions]") {
  const EvaluationContext context = MakeContext();
  std::string output;
  std::string error;
  REQUIRE(Interpolate("${{ format('py{0}-{1}', matrix.python, matrix.shard) }}", context, output,
                      error));
  REQUIRE(output == "py3.12-2");

  bool result = false;
  REQUIRE_FALSE(EvaluateCondition("format('{1}', 'only')", context, result, error));

  std::string many = "format('{11}'";
  for (int i = 0; i < 12; ++i) {
    many += ", 'a" + std::to_string(i) + "'";
  }
  REQUIRE(Interpolate("${{ " + many + ") }}", context, output, error));
  REQUIRE(output == "a11");
}

TEST_CASE("format placeholders beyond the argument list are errors, not crashes",
          "[conditions][gate]") {
  const EvaluationContext context = MakeContext();

  StepGate gate = EvaluateStepGate(
      std::string("format('{99999999999999999999999}', 'a') == 'a'"), context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kConditionError);

  // Largest size_t index: must not wrap around to the pattern argument.
  gate = EvaluateStepGate(std::string("format('{18446744073709551615}', 'a') == "
                                      "'{18446744073709551615}'"),
                          context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kConditionError);

  std::string output;
  std::string error;
  REQUIRE_FALSE(Interpolate("${{ format('{4294967296}', 'a') }}", context, output, error));
  REQUIRE(error.find("no matching argument") != std::string::npos);
}

TEST_CASE("Interpolation keeps closing braces inside string literals", "[conditions]") {
  const EvaluationContext context = MakeContext();
  std::string output;
  std::string error;

  REQUIRE(Interpolate("${{ format('{{0}} {0}', 'x') }}", context, output, error));
  REQUIRE(output == "{0} x");

  REQUIRE(Interpolate("${{ 'a}}b' }}", context, output, error));
  REQUIRE(output == "a}}b");

  REQUIRE(Interpolate("[${{ 'it''s }}' }}]", context, output, error));
  REQUIRE(output == "[it's }}]");
}

TEST_CASE("Status functions reflect job state", "[conditions]") {
  EvaluationContext context = MakeContext();
  REQUIRE(Eval("success()", context));
  REQUIRE_FALSE(Eval("failure()", context));
  REQUIRE(Eval("always()", context));
  REQUIRE_FALSE(Eval("cancelled()", context));
  REQUIRE(Eval("job.status == 'success'", context));

  context.job_failed = true;
  REQUIRE_FALSE(Eval("success()", context));
  REQUIRE(Eval("failure()", context));
  REQUIRE(Eval("job.status == 'failure'", context));

  context.job_failed = false;
  context.cancelled = true;
  REQUIRE_FALSE(Eval("success()", context));
  REQUIRE(Eval("cancelled()", context));
  REQUIRE(Eval("job.status == 'cancelled'", context));
}

TEST_CASE("Prior step outcomes are visible through steps.<id>", "[conditions]") {
  EvaluationContext context = MakeContext();
  context.steps["lint"] = {.outcome = "failed", .conclusion = "succeeded"};
  REQUIRE(Eval("steps.lint.outcome == 'failed'", context));
  REQUIRE(Eval("steps.lint.conclusion == 'succeeded'", context));
  REQUIRE_FALSE(Eval("steps.build.outcome == 'succeeded'", context));
}

TEST_CASE("Malformed and unknown expressions report errors", "[conditions]") {
  const EvaluationContext context = MakeContext();
  bool result = false;
  std::string error;

  REQUIRE_FALSE(EvaluateCondition("matrix.os = 'x'", context, result, error));
  REQUIRE(error.find("col") != std::string::npos);

  REQUIRE_FALSE(EvaluateCondition("matrix.os == 'unterminated", context, result, error));
  REQUIRE_FALSE(EvaluateCondition("secrets.TOKEN", context, result, error));
  REQUIRE(error.find("unknown context") != std::string::npos);
  REQUIRE_FALSE(EvaluateCondition("hashFiles('x')", context, result, error));
  REQUIRE_FALSE(EvaluateCondition("success(1)", context, result, error));
}

TEST_CASE("Strict mode turns missing properties into errors", "[conditions]") {
  EvaluationContext context = MakeContext();
  context.strict = true;
  std::string output;
  std::string error;
  REQUIRE(Interpolate("${{ matrix.os }}", context, output, error));
  REQUIRE(output == "ubuntu-latest");
  REQUIRE_FALSE(Interpolate("${{ matrix.runner }}", context, output, error));
  REQUIRE(error.find("undefined reference") != std::string::npos);
}

TEST_CASE("Interpolation renders values as text", "[conditions]") {
  const EvaluationContext context = MakeContext();
  std::string output;
  std::string error;
  REQUIRE(Interpolate("python ${{ matrix.python }} shard ${{matrix.shard}}${{ matrix.none }}.",
                      context, output, error));
  REQUIRE(output == "python 3.12 shard 2.");

  REQUIRE(Interpolate("no expressions here", context, output, error));
  REQUIRE(output == "no expressions here");

  REQUIRE_FALSE(Interpolate("broken ${{ matrix.os", context, output, error));
  REQUIRE(error.find("unterminated") != std::string::npos);
}

TEST_CASE("Step gate applies the implicit success guard", "[conditions][gate]") {
  EvaluationContext context = MakeContext();

  StepGate gate = EvaluateStepGate(std::nullopt, context);
  REQUIRE(gate.run);

  gate = EvaluateStepGate(std::string("matrix.shard == 2"), context);
  REQUIRE(gate.run);

  context.job_failed = true;
  gate = EvaluateStepGate(std::nullopt, context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kPriorFailure);

  // A true condition without a status function is still guarded.
  gate = EvaluateStepGate(std::string("matrix.shard == 2"), context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kPriorFailure);

  gate = EvaluateStepGate(std::string("always()"), context);
  REQUIRE(gate.run);
  gate = EvaluateStepGate(std::string("failure() && matrix.shard == 2"), context);
  REQUIRE(gate.run);
  gate = EvaluateStepGate(std::string("success()"), context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kConditionFalse);
}

TEST_CASE("Step gate reports cancellation separately from failure", "[conditions][gate]") {
  EvaluationContext context = MakeContext();
  context.cancelled = true;

  StepGate gate = EvaluateStepGate(std::nullopt, context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kCancelled);

  gate = EvaluateStepGate(std::string("cancelled()"), context);
  REQUIRE(gate.run);
}

TEST_CASE("Step gate skips malformed conditions with a diagnostic", "[conditions][gate]") {
  const EvaluationContext context = MakeContext();
  const StepGate gate = EvaluateStepGate(std::string("matrix.os ==="), context);
  REQUIRE_FALSE(gate.run);
  REQUIRE(gate.reason == GateReason::kConditionError);
  REQUIRE_FALSE(gate.diagnostic.empty());
  REQUIRE(std::string(gridrun::conditions::ToString(gate.reason)) == "condition_error");
}

TEST_CASE("Blank conditions behave like no condition", "[conditions][gate]") {
  const EvaluationContext context = MakeContext();
  const StepGate gate = EvaluateStepGate(std::string("   "), context);
  REQUIRE(gate.run);
  REQUIRE(gate.reason == GateReason::kRun);
}
