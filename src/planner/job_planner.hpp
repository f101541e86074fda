#pragma once

#include "core/json_dom.hpp"
#include "matrix/matrix_resolver.hpp"
#include "pipeline/model.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridrun::planner {

// Used when neither the step, its action, the job nor the pipeline names one.
inline constexpr std::string_view kDefaultShell = "sh -e {0}";

enum class FailurePolicy {
  kFatal,
  kTolerant,
};

const char* ToString(FailurePolicy policy);

// One step with everything known before execution resolved. `script` and the
// condition stay raw: they may read `steps.<id>` and are interpolated by the
// step executor when the step is reached.
struct PlannedStep {
  std::size_t index = 0;
  // Explicit `id`; empty steps are not visible through `steps.<id>`.
  std::string id;
  std::string display_name;
  std::optional<std::string> condition;
  // `run` for inline scripts, otherwise the `uses` action id.
  std::string action;
  std::string script;
  std::string shell;
  // `with` inputs, exposed to action scripts as `inputs.<name>`.
  core::json::Value inputs = core::json::MakeObject();
  // Pipeline < job < step.
  std::map<std::string, std::string> env;
  std::optional<std::string> working_directory;
  std::vector<std::string> platforms;
  FailurePolicy policy = FailurePolicy::kFatal;
  // Set when the step can never run successfully (unregistered action); the
  // executor fails the step with this message instead of invoking a runner.
  std::string plan_error;
};

struct ExecutableJob {
  // `<template>-NNN`, 1-based over every resolved combination.
  std::string id;
  std::string template_name;
  std::string display_name;
  matrix::Combination combination;
  core::json::Value matrix = core::json::MakeObject();
  std::string runner_label;
  pipeline::RunnerSpec runner;
  std::map<std::string, std::string> env;
  std::vector<PlannedStep> steps;
  // Non-fatal planning notes (an unusable continue-on-error expression).
  std::vector<std::string> diagnostics;
};

struct UnplannableJob {
  std::string id;
  std::string template_name;
  std::string display_name;
  matrix::Combination combination;
  std::string reason;
};

struct JobPlan {
  std::string template_name;
  bool fail_fast = true;
  std::optional<std::uint64_t> max_parallel;
  std::vector<ExecutableJob> jobs;
  std::vector<UnplannableJob> unplannable;
  std::vector<matrix::ResolutionDiagnostic> diagnostics;
};

// Maps a runner label to its platform: exact lookup in `pipeline.runners`,
// then the built-in label prefixes (ubuntu/linux, macos, windows).
bool ResolveRunnerPlatform(const pipeline::PipelineModel& pipeline, std::string_view label,
                           pipeline::RunnerSpec& runner, std::string& error);

// `<template> (<v1>, <v2>, ...)`, or the bare template name for an empty
// combination.
std::string MakeJobDisplayName(std::string_view template_name,
                               const matrix::Combination& combination);

// Plans every combination of an already resolved matrix. Combinations whose
// runner label cannot be resolved are reported in `unplannable` and never
// abort the rest of the plan.
JobPlan PlanJobs(const pipeline::PipelineModel& pipeline, const pipeline::JobTemplate& job,
                 const matrix::ResolvedMatrix& resolved);

// Resolves the template's matrix, then plans it.
JobPlan PlanTemplate(const pipeline::PipelineModel& pipeline, const pipeline::JobTemplate& job);

} // namespace gridrun::planner
