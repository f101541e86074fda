#include "execution/shell_action_runner.hpp"

#include "core/fs_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>

#if !defined(_WIN32)
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace gridrun::execution {

namespace {

bool IsExportableName(std::string_view name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_') {
      return false;
    }
  }
  return true;
}

// Removes the temporary script when the step returns, whatever the path.
class ScopedScriptFile {
public:
  explicit ScopedScriptFile(fs::path path) : path_(std::move(path)) {}
  ~ScopedScriptFile() {
    std::error_code ec;
    (void)fs::remove(path_, ec);
  }

  ScopedScriptFile(const ScopedScriptFile&) = delete;
  ScopedScriptFile& operator=(const ScopedScriptFile&) = delete;

  const fs::path& path() const {
    return path_;
  }

private:
  fs::path path_;
};

#if !defined(_WIN32)
// Runs `command` under /bin/sh in a new process group and waits for it.
//
// The child leaves gridrun's process group, so a terminal Ctrl-C reaches only
// gridrun (which turns it into a cancellation at the next step boundary) and
// the running step finishes. Unlike std::system, SIGINT is not ignored in the
// parent while the child runs. stdin is /dev/null: a background process group
// reading the terminal would be stopped.
bool LaunchInOwnProcessGroup(const std::string& command, int& raw_status, std::string& error) {
  const pid_t pid = fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    // Only async-signal-safe calls until exec.
    (void)setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      (void)close(null_fd);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }
  // Also set from the parent so the group exists before any signal arrives.
  (void)setpgid(pid, pid);

  while (waitpid(pid, &raw_status, 0) < 0) {
    if (errno != EINTR) {
      error = std::string("waitpid failed: ") + std::strerror(errno);
      return false;
    }
  }
  return true;
}
#endif

} // namespace

std::string ShellQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string ExpandShellTemplate(std::string_view shell_template, std::string_view script_path) {
  const std::string quoted_path = ShellQuote(script_path);
  std::string command(shell_template);
  const std::string needle = "{0}";
  if (command.find(needle) == std::string::npos) {
    return command + " " + quoted_path;
  }
  std::size_t pos = 0;
  while ((pos = command.find(needle, pos)) != std::string::npos) {
    command.replace(pos, needle.size(), quoted_path);
    pos += quoted_path.size();
  }
  return command;
}

bool BuildShellCommand(const ActionRequest& request, const fs::path& script_path,
                       std::string& command, std::string& error) {
  std::string env_prefix;
  for (const auto& [key, value] : request.env) {
    if (!IsExportableName(key)) {
      error = "environment variable name '" + key + "' cannot be exported to the shell";
      return false;
    }
    env_prefix += key + "=" + ShellQuote(value) + " ";
  }

  std::string body;
  if (request.working_directory.has_value() && !request.working_directory->empty()) {
    body += "cd " + ShellQuote(request.working_directory.value()) + " && ";
  }
  if (!env_prefix.empty()) {
    body += "env " + env_prefix;
  }
  body += ExpandShellTemplate(request.shell, script_path.string());

  command = "(" + body + ")";
  if (!request.log_path.empty()) {
    command += " > " + ShellQuote(request.log_path.string()) + " 2>&1";
  }
  return true;
}

ShellActionRunner::ShellActionRunner(fs::path scratch_dir) : scratch_dir_(std::move(scratch_dir)) {}

std::string ShellActionRunner::Name() const {
  return "shell";
}

bool ShellActionRunner::Run(const ActionRequest& request, ActionResult& result,
                            std::string& error) {
  error.clear();
  result = ActionResult{};

  std::error_code ec;
  fs::create_directories(scratch_dir_, ec);
  if (ec) {
    error = "failed to create scratch directory '" + scratch_dir_.string() + "': " + ec.message();
    return false;
  }
  if (!request.log_path.empty() && !core::EnsureParentDirectory(request.log_path, error)) {
    return false;
  }

  ScopedScriptFile script(core::MakeUniquePath(scratch_dir_, "step", ".sh"));
  if (!core::WriteTextFileAtomic(script.path(), request.script + "\n", error)) {
    return false;
  }

  std::string command;
  if (!BuildShellCommand(request, script.path(), command, error)) {
    return false;
  }

#if defined(_WIN32)
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command for step '" + request.step_name + "'";
    return false;
  }
  result.exit_code = raw_status;
#else
  int raw_status = 0;
  if (!LaunchInOwnProcessGroup(command, raw_status, error)) {
    error = "failed to execute shell command for step '" + request.step_name + "': " + error;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    result.exit_code = 128 + WTERMSIG(raw_status);
    result.note = "terminated by signal " + std::to_string(WTERMSIG(raw_status));
  } else {
    result.exit_code = raw_status;
  }
#endif
  return true;
}

} // namespace gridrun::execution
