#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"
#include "gridrun/cli/router.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using gridrun::core::errors::ExitCode;
using gridrun::core::errors::ToInt;
using gridrun::tests::common::AssertContains;
using gridrun::tests::common::AssertExitCode;
using gridrun::tests::common::AssertFileExists;
using gridrun::tests::common::Fail;
using gridrun::tests::common::ReadFileToString;

int main() {
  const fs::path temp_root = gridrun::tests::common::CreateUniqueTempDir("gridrun-dry-run");
  const fs::path marker = temp_root / "executed.txt";
  const fs::path pipeline_path = temp_root / "pipeline.json";
  gridrun::tests::common::WritePipelineFile(pipeline_path, R"JSON({
  "schema_version": "1.0",
  "pipeline_id": "dry_run_smoke",
  "jobs": {
    "build": {
      "runs-on": "${{ matrix.os }}",
      "strategy": {"matrix": {"os": ["ubuntu-latest", "macos-14"]}},
      "steps": [
        {"run": "touch ")JSON" + marker.string() + R"JSON("},
        {"run": "echo only on failure", "if": "failure()"}
      ]
    },
    "docs": {"runs-on": "ubuntu-latest", "steps": [{"run": "false"}]}
  }
})JSON");

  gridrun::cli::RunOptions options;
  options.pipeline_path = pipeline_path.string();
  options.output_dir = temp_root / "out";
  options.dry_run = true;
  options.job_filter = "build";
  options.log_level = gridrun::core::logging::LogLevel::kError;

  gridrun::cli::PipelineRunResult run_result;
  AssertExitCode(gridrun::cli::ExecutePipelineRun(options, &run_result), ToInt(ExitCode::kSuccess),
                 "dry run");

  if (fs::exists(marker)) {
    Fail("dry run must not execute step scripts");
  }
  if (!run_result.success || run_result.cancelled) {
    Fail("dry run should report success without cancellation");
  }
  if (run_result.run_dir != gridrun::tests::common::RequireSingleRunDir(options.output_dir)) {
    Fail("run_dir should point at the single run folder");
  }
  AssertFileExists(run_result.report_json_path, "report.json");
  AssertFileExists(run_result.summary_md_path, "summary.md");
  AssertFileExists(run_result.events_jsonl_path, "events.jsonl");
  if (fs::exists(run_result.run_dir / "logs")) {
    Fail("dry run should not create step logs");
  }

  const std::string report = ReadFileToString(run_result.report_json_path);
  AssertContains(report, "\"action_runner\":\"dry_run\"");
  AssertContains(report, "\"jobs_total\":2");
  AssertContains(report, "\"runner_os\":\"macOS\"");
  AssertContains(report, "\"skip_reason\":\"condition\"");
  // The filtered-out template never reaches the report.
  if (report.find("\"template\":\"docs\"") != std::string::npos) {
    Fail("--job filter should exclude the docs template");
  }

  gridrun::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}
