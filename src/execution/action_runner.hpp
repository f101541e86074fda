#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace gridrun::execution {

// Fully resolved unit of work handed to an action runner.
struct ActionRequest {
  std::string job_id;
  std::size_t step_index = 0;
  std::string step_name;
  // `run` or the registered action id.
  std::string action;
  std::string script;
  // Command template; `{0}` is replaced by the script path.
  std::string shell;
  std::map<std::string, std::string> env;
  std::optional<std::string> working_directory;
  // Combined stdout/stderr destination. Empty means inherit the process streams.
  std::filesystem::path log_path;
};

struct ActionResult {
  int exit_code = 0;
  // Short human note recorded with the step (dry-run marker, signal info).
  std::string note;
};

// Contract between the step executor and whatever actually runs a step.
//
// Contract goals:
// - the executor never interprets action semantics, it only gates and orders;
// - a non-zero `exit_code` is a normal result (a failed step), not an error;
// - `Run` returns false only when the action could not be launched at all;
// - implementations are called concurrently from job workers.
class IActionRunner {
public:
  virtual ~IActionRunner() = default;

  // Stable runner name recorded in the run config (`shell`, `dry_run`).
  virtual std::string Name() const = 0;

  virtual bool Run(const ActionRequest& request, ActionResult& result, std::string& error) = 0;
};

} // namespace gridrun::execution
