#include "pipeline/validator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace gridrun::pipeline {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsScalar(const JsonValue& value) {
  return value.IsString() || value.IsNumber() || value.IsBool();
}

bool IsPositiveInteger(const JsonValue& value) {
  return value.IsNumber() && std::isfinite(value.number_value) && value.number_value >= 1.0 &&
         std::floor(value.number_value) == value.number_value;
}

// Step ids are referenced as `steps.<id>` from conditions.
bool IsIdentifier(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(text.front());
  if (std::isalpha(first) == 0 && first != '_') {
    return false;
  }
  for (const char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && uc != '_' && uc != '-') {
      return false;
    }
  }
  return true;
}

void ValidateRequiredString(const JsonValue& object, std::string_view key, const std::string& path,
                            std::string_view hint, ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    AddIssue(report, path, "is required; " + std::string(hint));
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, path, "must be a string");
    return;
  }
  if (field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
  }
}

void ValidateOptionalString(const JsonValue& object, std::string_view key, const std::string& path,
                            ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field != nullptr && !field->IsString()) {
    AddIssue(report, path, "must be a string");
  }
}

void ValidateStringMap(const JsonValue& object, std::string_view key, const std::string& path,
                       ValidationReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsObject()) {
    AddIssue(report, path, "must be an object of string, number or bool values");
    return;
  }
  for (const auto& member_key : field->object_keys) {
    if (!IsScalar(field->object_value.at(member_key))) {
      AddIssue(report, path + "." + member_key, "must be a string, number or bool");
    }
  }
}

void ValidateShellDefaults(const JsonValue& object, const std::string& path,
                           ValidationReport& report) {
  const JsonValue* defaults = object.Find("defaults");
  if (defaults == nullptr) {
    return;
  }
  if (!defaults->IsObject()) {
    AddIssue(report, path, "must be an object");
    return;
  }
  const JsonValue* run = defaults->Find("run");
  if (run == nullptr) {
    return;
  }
  if (!run->IsObject()) {
    AddIssue(report, path + ".run", "must be an object");
    return;
  }
  ValidateOptionalString(*run, "shell", path + ".run.shell", report);
}

void ValidateRunners(const JsonValue& root, ValidationReport& report) {
  const JsonValue* runners = root.Find("runners");
  if (runners == nullptr) {
    return;
  }
  if (!runners->IsObject()) {
    AddIssue(report, "runners", "must be an object mapping runner labels to {os, arch}");
    return;
  }
  for (const auto& label : runners->object_keys) {
    const JsonValue& runner = runners->object_value.at(label);
    const std::string path = "runners." + label;
    if (!runner.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }
    ValidateRequiredString(runner, "os", path + ".os", "example: \"Linux\"", report);
    ValidateOptionalString(runner, "arch", path + ".arch", report);
  }
}

void ValidateActions(const JsonValue& root, ValidationReport& report) {
  const JsonValue* actions = root.Find("actions");
  if (actions == nullptr) {
    return;
  }
  if (!actions->IsObject()) {
    AddIssue(report, "actions", "must be an object mapping action ids to {run, shell}");
    return;
  }
  for (const auto& id : actions->object_keys) {
    const JsonValue& action = actions->object_value.at(id);
    const std::string path = "actions." + id;
    if (!action.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }
    ValidateRequiredString(action, "run", path + ".run", "the shell script the action runs",
                           report);
    ValidateOptionalString(action, "shell", path + ".shell", report);
  }
}

// Rule keys and values are not checked against the declared dimensions:
// unknown references are no-ops for the resolver, reported as diagnostics.
void ValidateMatrixRules(const JsonValue& rules, const std::string& path,
                         ValidationReport& report) {
  if (!rules.IsArray()) {
    AddIssue(report, path, "must be an array of objects");
    return;
  }
  for (std::size_t i = 0; i < rules.array_value.size(); ++i) {
    const JsonValue& rule = rules.array_value[i];
    const std::string rule_path = path + "[" + std::to_string(i) + "]";
    if (!rule.IsObject()) {
      AddIssue(report, rule_path, "must be an object");
      continue;
    }
    if (rule.object_keys.empty()) {
      AddIssue(report, rule_path, "must name at least one key");
    }
  }
}

void ValidateStrategy(const JsonValue& job, const std::string& job_path,
                      ValidationReport& report) {
  const JsonValue* strategy = job.Find("strategy");
  if (strategy == nullptr) {
    return;
  }
  const std::string path = job_path + ".strategy";
  if (!strategy->IsObject()) {
    AddIssue(report, path, "must be an object");
    return;
  }

  if (const JsonValue* fail_fast = strategy->Find("fail-fast");
      fail_fast != nullptr && !fail_fast->IsBool()) {
    AddIssue(report, path + ".fail-fast", "must be a bool");
  }
  if (const JsonValue* max_parallel = strategy->Find("max-parallel");
      max_parallel != nullptr && !IsPositiveInteger(*max_parallel)) {
    AddIssue(report, path + ".max-parallel", "must be a positive integer");
  }

  const JsonValue* matrix = strategy->Find("matrix");
  if (matrix == nullptr) {
    return;
  }
  const std::string matrix_path = path + ".matrix";
  if (!matrix->IsObject()) {
    AddIssue(report, matrix_path, "must be an object of dimension arrays");
    return;
  }

  for (const auto& key : matrix->object_keys) {
    if (key == "exclude" || key == "include") {
      continue;
    }
    const JsonValue& values = matrix->object_value.at(key);
    const std::string dimension_path = matrix_path + "." + key;
    if (!values.IsArray()) {
      AddIssue(report, dimension_path, "must be an array of values");
      continue;
    }
    for (std::size_t i = 0; i < values.array_value.size(); ++i) {
      const JsonValue& value = values.array_value[i];
      if (value.IsNull() || value.IsArray()) {
        AddIssue(report, dimension_path + "[" + std::to_string(i) + "]",
                 "must be a string, number, bool or object");
        continue;
      }
      for (std::size_t j = 0; j < i; ++j) {
        if (core::json::Equals(values.array_value[j], value)) {
          AddIssue(report, dimension_path + "[" + std::to_string(i) + "]",
                   "duplicates " + dimension_path + "[" + std::to_string(j) +
                       "]; dimension values must be unique");
          break;
        }
      }
    }
  }

  if (const JsonValue* excludes = matrix->Find("exclude"); excludes != nullptr) {
    ValidateMatrixRules(*excludes, matrix_path + ".exclude", report);
  }
  if (const JsonValue* includes = matrix->Find("include"); includes != nullptr) {
    ValidateMatrixRules(*includes, matrix_path + ".include", report);
  }
}

void ValidateStep(const JsonValue& step, const std::string& path, std::set<std::string>& step_ids,
                  ValidationReport& report) {
  if (!step.IsObject()) {
    AddIssue(report, path, "must be an object");
    return;
  }

  const JsonValue* run = step.Find("run");
  const JsonValue* uses = step.Find("uses");
  if (run == nullptr && uses == nullptr) {
    AddIssue(report, path, "must define exactly one of 'run' or 'uses'");
  } else if (run != nullptr && uses != nullptr) {
    AddIssue(report, path, "must not define both 'run' and 'uses'");
  }
  if (run != nullptr && (!run->IsString() || run->string_value.empty())) {
    AddIssue(report, path + ".run", "must be a non-empty string");
  }
  if (uses != nullptr && (!uses->IsString() || uses->string_value.empty())) {
    AddIssue(report, path + ".uses", "must be a non-empty string");
  }

  if (const JsonValue* id = step.Find("id"); id != nullptr) {
    if (!id->IsString() || !IsIdentifier(id->string_value)) {
      AddIssue(report, path + ".id", "must be an identifier [A-Za-z_][A-Za-z0-9_-]*");
    } else if (!step_ids.insert(id->string_value).second) {
      AddIssue(report, path + ".id",
               "duplicates an earlier step id '" + id->string_value + "' in this job");
    }
  }

  ValidateOptionalString(step, "name", path + ".name", report);
  ValidateOptionalString(step, "if", path + ".if", report);
  ValidateOptionalString(step, "shell", path + ".shell", report);
  ValidateOptionalString(step, "working-directory", path + ".working-directory", report);
  ValidateStringMap(step, "with", path + ".with", report);
  ValidateStringMap(step, "env", path + ".env", report);

  if (const JsonValue* platforms = step.Find("platforms"); platforms != nullptr) {
    bool ok = platforms->IsArray();
    if (ok) {
      for (const auto& platform : platforms->array_value) {
        ok = ok && platform.IsString() && !platform.string_value.empty();
      }
    }
    if (!ok) {
      AddIssue(report, path + ".platforms", "must be an array of runner OS names");
    }
  }

  if (const JsonValue* policy = step.Find("continue-on-error"); policy != nullptr) {
    const bool expression =
        policy->IsString() && policy->string_value.find("${{") != std::string::npos;
    if (!policy->IsBool() && !expression) {
      AddIssue(report, path + ".continue-on-error", "must be a bool or a ${{ }} expression");
    }
  }
}

void ValidateJob(const std::string& name, const JsonValue& job, ValidationReport& report) {
  const std::string path = "jobs." + name;
  if (!job.IsObject()) {
    AddIssue(report, path, "must be an object");
    return;
  }

  ValidateRequiredString(job, "runs-on", path + ".runs-on",
                         "example: \"ubuntu-latest\" or \"${{ matrix.os }}\"", report);
  ValidateStringMap(job, "env", path + ".env", report);
  ValidateShellDefaults(job, path + ".defaults", report);
  ValidateStrategy(job, path, report);

  const JsonValue* steps = job.Find("steps");
  if (steps == nullptr) {
    AddIssue(report, path + ".steps", "is required; list the steps this job runs");
    return;
  }
  if (!steps->IsArray() || steps->array_value.empty()) {
    AddIssue(report, path + ".steps", "must be a non-empty array");
    return;
  }
  std::set<std::string> step_ids;
  for (std::size_t i = 0; i < steps->array_value.size(); ++i) {
    ValidateStep(steps->array_value[i], path + ".steps[" + std::to_string(i) + "]", step_ids,
                 report);
  }
}

void ValidatePipelineObject(const JsonValue& root, ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "root JSON value must be an object");
    return;
  }

  ValidateRequiredString(root, "schema_version", "schema_version", "example: \"1.0\"", report);
  ValidateRequiredString(root, "pipeline_id", "pipeline_id", "example: \"python_package\"",
                         report);
  ValidateStringMap(root, "env", "env", report);
  ValidateShellDefaults(root, "defaults", report);
  ValidateRunners(root, report);
  ValidateActions(root, report);

  const JsonValue* jobs = root.Find("jobs");
  if (jobs == nullptr) {
    AddIssue(report, "jobs", "is required; define at least one job template");
    return;
  }
  if (!jobs->IsObject() || jobs->object_keys.empty()) {
    AddIssue(report, "jobs", "must be a non-empty object of job templates");
    return;
  }
  for (const auto& name : jobs->object_keys) {
    if (!IsIdentifier(name)) {
      AddIssue(report, "jobs." + name, "job name must be an identifier [A-Za-z_][A-Za-z0-9_-]*");
    }
    ValidateJob(name, jobs->object_value.at(name), report);
  }
}

} // namespace

bool ValidatePipelineText(std::string_view json_text, ValidationReport& report,
                          std::string& error) {
  (void)error;
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'gridrun validate <pipeline.json>')");
    report.valid = false;
    return true;
  }

  ValidatePipelineObject(root, report);
  report.valid = report.issues.empty();
  return true;
}

bool ValidatePipelineFile(const std::string& pipeline_path, ValidationReport& report,
                          std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(fs::path(pipeline_path), contents, error)) {
    return false;
  }
  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "pipeline file is empty; provide a valid JSON object");
    report.valid = false;
    return true;
  }
  return ValidatePipelineText(contents, report, error);
}

} // namespace gridrun::pipeline
