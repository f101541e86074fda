#pragma once

#include "matrix/matrix_resolver.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridrun::pipeline {

// Parsed pipeline document used by planning and execution.
//
// Design notes:
// - Optional scalar fields with unexpected types are treated as unset; the
//   validator is the strict schema gate and runs first in every CLI path.
// - Structural mismatches that would change what gets executed (a matrix
//   dimension that is not an array, a step that is not an object) are hard
//   parse errors.
struct RunnerSpec {
  std::string os;
  std::string arch;

  bool operator==(const RunnerSpec& other) const = default;
};

// Registered action a step can reference with `uses`. `run` may read
// `${{ inputs.<name> }}` from the step's `with` block.
struct ActionSpec {
  std::string run;
  std::optional<std::string> shell;

  bool operator==(const ActionSpec& other) const = default;
};

struct StepSpec {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> run;
  std::optional<std::string> uses;
  std::map<std::string, std::string> with;
  std::map<std::string, std::string> env;
  std::optional<std::string> condition;
  std::optional<std::string> shell;
  std::optional<std::string> working_directory;
  // Runner OS names this step applies to; empty means every platform.
  std::vector<std::string> platforms;

  // `continue-on-error`: literal flag, or an expression resolved per job.
  bool continue_on_error = false;
  std::optional<std::string> continue_on_error_expression;
};

struct JobTemplate {
  std::string name;
  matrix::MatrixSpec matrix;
  bool fail_fast = true;
  std::optional<std::uint64_t> max_parallel;
  std::string runs_on;
  std::map<std::string, std::string> env;
  std::optional<std::string> default_shell;
  std::vector<StepSpec> steps;
};

struct PipelineModel {
  std::string schema_version;
  std::string pipeline_id;
  std::map<std::string, std::string> env;
  std::map<std::string, RunnerSpec> runners;
  std::map<std::string, ActionSpec> actions;
  std::optional<std::string> default_shell;
  // Document order.
  std::vector<JobTemplate> jobs;

  const JobTemplate* FindJob(std::string_view name) const;
};

// Parses pipeline JSON text into a PipelineModel.
// Returns false on invalid JSON, a non-object root or a structural mismatch.
bool ParsePipelineModelText(std::string_view json_text, PipelineModel& model, std::string& error);

// Loads and parses a pipeline file into PipelineModel.
bool LoadPipelineModelFile(const std::string& pipeline_path, PipelineModel& model,
                           std::string& error);

} // namespace gridrun::pipeline
