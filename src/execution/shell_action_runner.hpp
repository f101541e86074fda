#pragma once

#include "execution/action_runner.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gridrun::execution {

// Runs step scripts through the host shell.
//
// The script is written to a temporary file under `scratch_dir`, the shell
// template's `{0}` is replaced by that path (or the path is appended when the
// template has no placeholder), and the command runs with the step's
// environment and working directory. The temporary file is removed afterwards.
class ShellActionRunner final : public IActionRunner {
public:
  explicit ShellActionRunner(std::filesystem::path scratch_dir);

  std::string Name() const override;
  bool Run(const ActionRequest& request, ActionResult& result, std::string& error) override;

private:
  std::filesystem::path scratch_dir_;
};

// Single-quoted POSIX shell word.
std::string ShellQuote(std::string_view raw);

// Expands a shell template (`bash -e {0}`) for one script path.
std::string ExpandShellTemplate(std::string_view shell_template, std::string_view script_path);

// Builds the full command line for a request whose script lives at
// `script_path`. Fails for environment names the shell cannot export.
bool BuildShellCommand(const ActionRequest& request, const std::filesystem::path& script_path,
                       std::string& command, std::string& error);

} // namespace gridrun::execution
