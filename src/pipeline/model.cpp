#include "pipeline/model.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <utility>

namespace fs = std::filesystem;

namespace gridrun::pipeline {

namespace {

using JsonValue = core::json::Value;

const JsonValue* FindJsonPath(const JsonValue& root, std::initializer_list<std::string_view> path) {
  const JsonValue* cursor = &root;
  for (const std::string_view key : path) {
    cursor = cursor->Find(key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

bool TryGetPositiveInteger(const JsonValue& value, std::uint64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 1.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

std::optional<std::string> ReadStringField(const JsonValue& root,
                                           std::initializer_list<std::string_view> path) {
  const JsonValue* value = FindJsonPath(root, path);
  if (value == nullptr || !value->IsString()) {
    return std::nullopt;
  }
  return value->string_value;
}

// Scalar members become strings ("3.9", "true"); nested values are dropped.
std::map<std::string, std::string> ReadStringMap(const JsonValue* object) {
  std::map<std::string, std::string> result;
  if (object == nullptr || !object->IsObject()) {
    return result;
  }
  for (const auto& key : object->object_keys) {
    const JsonValue& member = object->object_value.at(key);
    if (member.IsString() || member.IsNumber() || member.IsBool()) {
      result[key] = core::json::ToDisplayString(member);
    }
  }
  return result;
}

std::vector<matrix::MatrixField> ReadMatrixFields(const JsonValue& rule) {
  std::vector<matrix::MatrixField> fields;
  for (const auto& key : rule.object_keys) {
    fields.push_back({key, rule.object_value.at(key)});
  }
  return fields;
}

bool ParseMatrix(const JsonValue& job, const std::string& job_name, matrix::MatrixSpec& spec,
                 std::string& error) {
  spec = matrix::MatrixSpec{};
  const JsonValue* matrix_value = FindJsonPath(job, {"strategy", "matrix"});
  if (matrix_value == nullptr) {
    return true;
  }
  if (!matrix_value->IsObject()) {
    error = "jobs." + job_name + ".strategy.matrix must be an object";
    return false;
  }

  for (const auto& key : matrix_value->object_keys) {
    const JsonValue& member = matrix_value->object_value.at(key);
    if (key == "exclude" || key == "include") {
      if (!member.IsArray()) {
        error = "jobs." + job_name + ".strategy.matrix." + key + " must be an array";
        return false;
      }
      for (const auto& rule : member.array_value) {
        if (!rule.IsObject()) {
          error = "jobs." + job_name + ".strategy.matrix." + key + " entries must be objects";
          return false;
        }
        if (key == "exclude") {
          spec.excludes.push_back({ReadMatrixFields(rule)});
        } else {
          spec.includes.push_back({ReadMatrixFields(rule)});
        }
      }
      continue;
    }

    if (!member.IsArray()) {
      error = "jobs." + job_name + ".strategy.matrix." + key + " must be an array of values";
      return false;
    }
    spec.dimensions.push_back({key, member.array_value});
  }
  return true;
}

bool ParseStep(const JsonValue& value, const std::string& path, StepSpec& step,
               std::string& error) {
  step = StepSpec{};
  if (!value.IsObject()) {
    error = path + " must be an object";
    return false;
  }

  step.id = ReadStringField(value, {"id"});
  step.name = ReadStringField(value, {"name"});
  step.run = ReadStringField(value, {"run"});
  step.uses = ReadStringField(value, {"uses"});
  step.condition = ReadStringField(value, {"if"});
  step.shell = ReadStringField(value, {"shell"});
  step.working_directory = ReadStringField(value, {"working-directory"});
  step.with = ReadStringMap(value.Find("with"));
  step.env = ReadStringMap(value.Find("env"));

  if (const JsonValue* platforms = value.Find("platforms");
      platforms != nullptr && platforms->IsArray()) {
    for (const auto& platform : platforms->array_value) {
      if (platform.IsString()) {
        step.platforms.push_back(platform.string_value);
      }
    }
  }

  if (const JsonValue* policy = value.Find("continue-on-error"); policy != nullptr) {
    if (policy->IsBool()) {
      step.continue_on_error = policy->bool_value;
    } else if (policy->IsString()) {
      step.continue_on_error_expression = policy->string_value;
    }
  }

  if (!step.run.has_value() && !step.uses.has_value()) {
    error = path + " must define either 'run' or 'uses'";
    return false;
  }
  return true;
}

bool ParseJob(const std::string& name, const JsonValue& value, JobTemplate& job,
              std::string& error) {
  job = JobTemplate{};
  job.name = name;
  if (!value.IsObject()) {
    error = "jobs." + name + " must be an object";
    return false;
  }

  if (!ParseMatrix(value, name, job.matrix, error)) {
    return false;
  }

  if (const JsonValue* fail_fast = FindJsonPath(value, {"strategy", "fail-fast"});
      fail_fast != nullptr && fail_fast->IsBool()) {
    job.fail_fast = fail_fast->bool_value;
  }
  if (const JsonValue* max_parallel = FindJsonPath(value, {"strategy", "max-parallel"});
      max_parallel != nullptr) {
    std::uint64_t parsed = 0;
    if (TryGetPositiveInteger(*max_parallel, parsed)) {
      job.max_parallel = parsed;
    }
  }

  job.runs_on = ReadStringField(value, {"runs-on"}).value_or("");
  job.env = ReadStringMap(value.Find("env"));
  job.default_shell = ReadStringField(value, {"defaults", "run", "shell"});

  const JsonValue* steps = value.Find("steps");
  if (steps == nullptr || !steps->IsArray()) {
    error = "jobs." + name + ".steps must be an array";
    return false;
  }
  for (std::size_t i = 0; i < steps->array_value.size(); ++i) {
    StepSpec step;
    if (!ParseStep(steps->array_value[i], "jobs." + name + ".steps[" + std::to_string(i) + "]",
                   step, error)) {
      return false;
    }
    job.steps.push_back(std::move(step));
  }
  return true;
}

bool ParsePipelineModelRoot(const JsonValue& root, PipelineModel& model, std::string& error) {
  model = PipelineModel{};
  error.clear();

  model.schema_version = ReadStringField(root, {"schema_version"}).value_or("");
  model.pipeline_id = ReadStringField(root, {"pipeline_id"}).value_or("");
  model.env = ReadStringMap(root.Find("env"));
  model.default_shell = ReadStringField(root, {"defaults", "run", "shell"});

  if (const JsonValue* runners = root.Find("runners"); runners != nullptr && runners->IsObject()) {
    for (const auto& label : runners->object_keys) {
      const JsonValue& runner = runners->object_value.at(label);
      RunnerSpec spec;
      spec.os = ReadStringField(runner, {"os"}).value_or("");
      spec.arch = ReadStringField(runner, {"arch"}).value_or("");
      if (!spec.os.empty()) {
        model.runners[label] = std::move(spec);
      }
    }
  }

  if (const JsonValue* actions = root.Find("actions"); actions != nullptr && actions->IsObject()) {
    for (const auto& id : actions->object_keys) {
      const JsonValue& action = actions->object_value.at(id);
      const std::optional<std::string> run = ReadStringField(action, {"run"});
      if (!run.has_value()) {
        continue;
      }
      model.actions[id] = ActionSpec{.run = run.value(), .shell = ReadStringField(action, {"shell"})};
    }
  }

  const JsonValue* jobs = root.Find("jobs");
  if (jobs == nullptr || !jobs->IsObject()) {
    error = "pipeline 'jobs' must be an object";
    return false;
  }
  for (const auto& name : jobs->object_keys) {
    JobTemplate job;
    if (!ParseJob(name, jobs->object_value.at(name), job, error)) {
      return false;
    }
    model.jobs.push_back(std::move(job));
  }
  return true;
}

} // namespace

const JobTemplate* PipelineModel::FindJob(std::string_view name) const {
  for (const auto& job : jobs) {
    if (job.name == name) {
      return &job;
    }
  }
  return nullptr;
}

bool ParsePipelineModelText(std::string_view json_text, PipelineModel& model, std::string& error) {
  model = PipelineModel{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid pipeline JSON: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "pipeline root must be a JSON object";
    return false;
  }

  return ParsePipelineModelRoot(root, model, error);
}

bool LoadPipelineModelFile(const std::string& pipeline_path, PipelineModel& model,
                           std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(fs::path(pipeline_path), contents, error)) {
    return false;
  }
  return ParsePipelineModelText(contents, model, error);
}

} // namespace gridrun::pipeline
