#include "planner/job_planner.hpp"

#include "conditions/condition_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace gridrun::planner {

namespace {

struct PlatformPrefix {
  std::string_view prefix;
  std::string_view os;
};

// Hosted runner label families.
constexpr PlatformPrefix kPlatformPrefixes[] = {
    {"ubuntu", "Linux"},
    {"linux", "Linux"},
    {"macos", "macOS"},
    {"windows", "Windows"},
};

std::string ToLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string FormatOrdinal(std::size_t ordinal) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%03zu", ordinal);
  return buffer;
}

std::string FirstLine(std::string_view text) {
  const std::size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return "";
  }
  const std::size_t end = text.find_first_of("\r\n", start);
  return std::string(text.substr(start, end == std::string_view::npos ? end : end - start));
}

// Interpolation that keeps going on error: the raw text is kept and the
// problem is recorded on the job.
std::string InterpolateOrKeep(const std::string& text, const conditions::EvaluationContext& context,
                              const std::string& where, ExecutableJob& job) {
  std::string output;
  std::string error;
  if (!conditions::Interpolate(text, context, output, error)) {
    job.diagnostics.push_back(where + ": " + error);
    return text;
  }
  return output;
}

std::map<std::string, std::string>
InterpolateEnv(const std::map<std::string, std::string>& base,
               const std::map<std::string, std::string>& overrides,
               const conditions::EvaluationContext& context, const std::string& where,
               ExecutableJob& job) {
  std::map<std::string, std::string> merged = base;
  for (const auto& [key, value] : overrides) {
    merged[key] = InterpolateOrKeep(value, context, where + "." + key, job);
  }
  return merged;
}

std::string ResolveShell(const pipeline::PipelineModel& pipeline,
                         const pipeline::JobTemplate& job_template, const pipeline::StepSpec& step,
                         const pipeline::ActionSpec* action) {
  if (step.shell.has_value()) {
    return step.shell.value();
  }
  if (action != nullptr && action->shell.has_value()) {
    return action->shell.value();
  }
  if (job_template.default_shell.has_value()) {
    return job_template.default_shell.value();
  }
  if (pipeline.default_shell.has_value()) {
    return pipeline.default_shell.value();
  }
  return std::string(kDefaultShell);
}

FailurePolicy ResolvePolicy(const pipeline::StepSpec& step,
                            const conditions::EvaluationContext& context, const std::string& where,
                            ExecutableJob& job) {
  if (!step.continue_on_error_expression.has_value()) {
    return step.continue_on_error ? FailurePolicy::kTolerant : FailurePolicy::kFatal;
  }
  bool tolerant = false;
  std::string error;
  if (!conditions::EvaluateCondition(step.continue_on_error_expression.value(), context, tolerant,
                                     error)) {
    job.diagnostics.push_back(where + ".continue-on-error: " + error + "; treating step as fatal");
    return FailurePolicy::kFatal;
  }
  return tolerant ? FailurePolicy::kTolerant : FailurePolicy::kFatal;
}

PlannedStep PlanStep(const pipeline::PipelineModel& pipeline,
                     const pipeline::JobTemplate& job_template, const pipeline::StepSpec& spec,
                     std::size_t index, const conditions::EvaluationContext& context,
                     ExecutableJob& job) {
  const std::string where = job.id + ".steps[" + std::to_string(index) + "]";

  PlannedStep step;
  step.index = index;
  step.id = spec.id.value_or("");
  step.condition = spec.condition;
  step.platforms = spec.platforms;
  step.policy = ResolvePolicy(spec, context, where, job);
  step.env = InterpolateEnv(job.env, spec.env, context, where + ".env", job);
  if (spec.working_directory.has_value()) {
    step.working_directory =
        InterpolateOrKeep(spec.working_directory.value(), context, where + ".working-directory", job);
  }
  for (const auto& [key, value] : spec.with) {
    step.inputs.Set(key,
                    core::json::MakeString(InterpolateOrKeep(value, context, where + ".with." + key, job)));
  }

  const pipeline::ActionSpec* action = nullptr;
  if (spec.run.has_value()) {
    step.action = "run";
    step.script = spec.run.value();
  } else {
    step.action = spec.uses.value_or("");
    const auto it = pipeline.actions.find(step.action);
    if (it == pipeline.actions.end()) {
      step.plan_error = "action '" + step.action + "' is not registered in 'actions'";
    } else {
      action = &it->second;
      step.script = action->run;
    }
  }
  step.shell = ResolveShell(pipeline, job_template, spec, action);

  if (spec.name.has_value()) {
    step.display_name = InterpolateOrKeep(spec.name.value(), context, where + ".name", job);
  } else if (spec.run.has_value()) {
    step.display_name = "Run " + FirstLine(spec.run.value());
  } else {
    step.display_name = "Run " + step.action;
  }
  return step;
}

} // namespace

const char* ToString(FailurePolicy policy) {
  switch (policy) {
  case FailurePolicy::kFatal:
    return "fatal";
  case FailurePolicy::kTolerant:
    return "tolerant";
  }
  return "unknown";
}

bool ResolveRunnerPlatform(const pipeline::PipelineModel& pipeline, std::string_view label,
                           pipeline::RunnerSpec& runner, std::string& error) {
  if (label.empty()) {
    error = "runner label is empty";
    return false;
  }
  if (const auto it = pipeline.runners.find(std::string(label)); it != pipeline.runners.end()) {
    runner = it->second;
    if (runner.arch.empty()) {
      runner.arch = "X64";
    }
    return true;
  }

  const std::string lowered = ToLower(label);
  for (const auto& entry : kPlatformPrefixes) {
    if (lowered.rfind(entry.prefix, 0) == 0) {
      runner = pipeline::RunnerSpec{.os = std::string(entry.os), .arch = "X64"};
      return true;
    }
  }
  error = "runner label '" + std::string(label) +
          "' matches no entry in 'runners' and no known platform prefix";
  return false;
}

std::string MakeJobDisplayName(std::string_view template_name,
                               const matrix::Combination& combination) {
  if (combination.entries.empty()) {
    return std::string(template_name);
  }
  return std::string(template_name) + " (" + matrix::DescribeCombination(combination) + ")";
}

JobPlan PlanJobs(const pipeline::PipelineModel& pipeline, const pipeline::JobTemplate& job_template,
                 const matrix::ResolvedMatrix& resolved) {
  JobPlan plan;
  plan.template_name = job_template.name;
  plan.fail_fast = job_template.fail_fast;
  plan.max_parallel = job_template.max_parallel;
  plan.diagnostics = resolved.diagnostics;

  for (std::size_t i = 0; i < resolved.combinations.size(); ++i) {
    const matrix::Combination& combination = resolved.combinations[i];

    ExecutableJob job;
    job.id = job_template.name + "-" + FormatOrdinal(i + 1U);
    job.template_name = job_template.name;
    job.display_name = MakeJobDisplayName(job_template.name, combination);
    job.combination = combination;
    job.matrix = combination.ToObject();

    conditions::EvaluationContext context;
    context.matrix = job.matrix;
    context.env = pipeline.env;

    // Strict: a runner label reading an absent matrix key is unplannable, not
    // an empty string.
    std::string label;
    std::string error;
    context.strict = true;
    bool planned = conditions::Interpolate(job_template.runs_on, context, label, error) &&
                   ResolveRunnerPlatform(pipeline, label, job.runner, error);
    context.strict = false;
    if (!planned) {
      plan.unplannable.push_back({.id = job.id,
                                  .template_name = job.template_name,
                                  .display_name = job.display_name,
                                  .combination = combination,
                                  .reason = error});
      continue;
    }
    job.runner_label = label;

    context.runner_os = job.runner.os;
    context.runner_arch = job.runner.arch;
    context.runner_name = job.runner_label;
    job.env = InterpolateEnv(pipeline.env, job_template.env, context, job.id + ".env", job);
    context.env = job.env;

    for (std::size_t s = 0; s < job_template.steps.size(); ++s) {
      job.steps.push_back(PlanStep(pipeline, job_template, job_template.steps[s], s, context, job));
    }
    plan.jobs.push_back(std::move(job));
  }
  return plan;
}

JobPlan PlanTemplate(const pipeline::PipelineModel& pipeline,
                     const pipeline::JobTemplate& job_template) {
  return PlanJobs(pipeline, job_template, matrix::ResolveMatrix(job_template.matrix));
}

} // namespace gridrun::planner
