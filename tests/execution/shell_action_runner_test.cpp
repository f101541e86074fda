#include "execution/shell_action_runner.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using gridrun::execution::ActionRequest;
using gridrun::execution::ActionResult;
using gridrun::execution::BuildShellCommand;
using gridrun::execution::ExpandShellTemplate;
using gridrun::execution::ShellQuote;

TEST_CASE("Shell quoting survives embedded single quotes", "[execution][shell]") {
  REQUIRE(ShellQuote("plain") == "'plain'");
  REQUIRE(ShellQuote("it's") == "'it'\\''s'");
  REQUIRE(ShellQuote("") == "''");
}

TEST_CASE("Shell templates substitute or append the script path", "[execution][shell]") {
  REQUIRE(ExpandShellTemplate("bash -e {0}", "/tmp/s.sh") == "bash -e '/tmp/s.sh'");
  REQUIRE(ExpandShellTemplate("python", "/tmp/s.sh") == "python '/tmp/s.sh'");
  REQUIRE(ExpandShellTemplate("sh -c '. {0}; . {0}'", "/x") == "sh -c '. '/x'; . '/x''");
}

TEST_CASE("Shell command carries directory, environment and log redirection",
          "[execution][shell]") {
  ActionRequest request;
  request.shell = "sh -e {0}";
  request.env = {{"PY", "3.12"}, {"MSG", "a b"}};
  request.working_directory = "build dir";
  request.log_path = "/tmp/logs/01.log";

  std::string command;
  std::string error;
  REQUIRE(BuildShellCommand(request, "/tmp/step.sh", command, error));
  REQUIRE(command ==
          "(cd 'build dir' && env MSG='a b' PY='3.12' sh -e '/tmp/step.sh') > "
          "'/tmp/logs/01.log' 2>&1");
}

TEST_CASE("Shell command rejects environment names the shell cannot export",
          "[execution][shell]") {
  ActionRequest request;
  request.shell = "sh {0}";
  request.env = {{"BAD-NAME", "x"}};

  std::string command;
  std::string error;
  REQUIRE_FALSE(BuildShellCommand(request, "/tmp/step.sh", command, error));
  REQUIRE(error.find("BAD-NAME") != std::string::npos);
}

TEST_CASE("Shell runner reports exit codes and captures output", "[execution][shell]") {
  gridrun::tests::common::ScopedTempDir temp("gridrun-shell-runner");
  gridrun::execution::ShellActionRunner runner(temp.path() / "scratch");
  REQUIRE(runner.Name() == "shell");

  ActionRequest request;
  request.job_id = "test-001";
  request.step_name = "Run echo";
  request.action = "run";
  request.shell = "sh -e {0}";
  request.env = {{"GREETING", "hello from gridrun"}};
  request.script = "echo \"$GREETING\"\nexit 7";
  request.log_path = temp.path() / "logs" / "test-001" / "01.log";

  ActionResult result;
  std::string error;
  REQUIRE(runner.Run(request, result, error));
  REQUIRE(result.exit_code == 7);

  const std::string log = gridrun::tests::common::ReadFileToString(request.log_path);
  REQUIRE(log.find("hello from gridrun") != std::string::npos);

  // Temporary scripts never outlive the step.
  REQUIRE(fs::is_empty(temp.path() / "scratch"));
}
