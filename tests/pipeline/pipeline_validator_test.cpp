#include "pipeline/validator.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>

using gridrun::pipeline::ValidatePipelineText;
using gridrun::pipeline::ValidationReport;

namespace {

ValidationReport Validate(std::string_view json) {
  ValidationReport report;
  std::string error;
  REQUIRE(ValidatePipelineText(json, report, error));
  return report;
}

bool HasIssueAt(const ValidationReport& report, std::string_view path) {
  for (const auto& issue : report.issues) {
    if (issue.path == path) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Well-formed pipeline validates cleanly", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"JSON({
    "schema_version": "1.0",
    "pipeline_id": "python_package",
    "env": {"CI": true},
    "runners": {"self-hosted-arm": {"os": "Linux", "arch": "ARM64"}},
    "actions": {"setup-python": {"run": "echo setting up ${{ inputs.version }}"}},
    "jobs": {
      "test": {
        "runs-on": "${{ matrix.os }}",
        "strategy": {
          "fail-fast": false,
          "max-parallel": 2,
          "matrix": {
            "os": ["ubuntu-latest", "macos-latest"],
            "python": ["3.11", "3.12"],
            "exclude": [{"os": "macos-latest", "python": "3.11"}],
            "include": [{"os": "ubuntu-latest", "python": "3.12", "coverage": true}]
          }
        },
        "steps": [
          {"id": "setup", "uses": "setup-python", "with": {"version": "${{ matrix.python }}"}},
          {"id": "lint", "run": "make lint", "continue-on-error": true},
          {"run": "make test", "if": "matrix.python != '3.10'", "platforms": ["Linux"]},
          {"run": "make report", "if": "always()", "continue-on-error": "${{ matrix.coverage }}"}
        ]
      }
    }
  })JSON");
  INFO((report.issues.empty() ? std::string() : report.issues.front().path + ": " +
                                                     report.issues.front().message));
  REQUIRE(report.valid);
  REQUIRE(report.issues.empty());
}

TEST_CASE("Parse errors are reported at the document root", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"({"schema_version": "1.0",)");
  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.size() == 1U);
  REQUIRE(report.issues[0].path == "$");
  REQUIRE(report.issues[0].message.find("gridrun validate") != std::string::npos);
}

TEST_CASE("Missing top-level fields are each reported", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"({"env": {"A": "1"}})");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "schema_version"));
  REQUIRE(HasIssueAt(report, "pipeline_id"));
  REQUIRE(HasIssueAt(report, "jobs"));
}

TEST_CASE("Step and strategy shape errors carry precise paths", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"JSON({
    "schema_version": "1.0",
    "pipeline_id": "broken",
    "jobs": {
      "build": {
        "runs-on": "ubuntu-latest",
        "strategy": {
          "fail-fast": "yes",
          "max-parallel": 0,
          "matrix": {
            "os": "ubuntu-latest",
            "python": ["3.11", "3.11", null],
            "exclude": [{}]
          }
        },
        "steps": [
          {"run": "make", "uses": "setup"},
          {"name": "nothing to do"},
          {"id": "dup", "run": "a"},
          {"id": "dup", "run": "b"},
          {"run": "c", "continue-on-error": "maybe"},
          {"run": "d", "platforms": "Linux"},
          {"run": "e", "env": {"NESTED": {"x": 1}}}
        ]
      }
    }
  })JSON");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.fail-fast"));
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.max-parallel"));
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.matrix.os"));
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.matrix.python[1]"));
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.matrix.python[2]"));
  REQUIRE(HasIssueAt(report, "jobs.build.strategy.matrix.exclude[0]"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[0]"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[1]"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[3].id"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[4].continue-on-error"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[5].platforms"));
  REQUIRE(HasIssueAt(report, "jobs.build.steps[6].env.NESTED"));
}

TEST_CASE("Unknown matrix references in rules are not schema errors", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"JSON({
    "schema_version": "1.0",
    "pipeline_id": "forgiving",
    "jobs": {
      "test": {
        "runs-on": "ubuntu-latest",
        "strategy": {"matrix": {
          "os": ["A", "B"],
          "exclude": [{"os": "Z"}, {"arch": "arm64"}],
          "include": [{"os": "C", "extra": "y"}]
        }},
        "steps": [{"run": "true"}]
      }
    }
  })JSON");
  REQUIRE(report.valid);
}

TEST_CASE("Jobs must define runs-on and a non-empty step list", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"JSON({
    "schema_version": "1.0",
    "pipeline_id": "p",
    "jobs": {
      "a": {"steps": []},
      "b b": {"runs-on": "ubuntu-latest", "steps": [{"run": "true"}]}
    }
  })JSON");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "jobs.a.runs-on"));
  REQUIRE(HasIssueAt(report, "jobs.a.steps"));
  REQUIRE(HasIssueAt(report, "jobs.b b"));
}

TEST_CASE("Runner and action tables are checked", "[pipeline][validator]") {
  const ValidationReport report = Validate(R"JSON({
    "schema_version": "1.0",
    "pipeline_id": "p",
    "runners": {"gpu": {"arch": "X64"}},
    "actions": {"setup": {"shell": "bash"}},
    "jobs": {"a": {"runs-on": "gpu", "steps": [{"uses": "setup"}]}}
  })JSON");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "runners.gpu.os"));
  REQUIRE(HasIssueAt(report, "actions.setup.run"));
}
