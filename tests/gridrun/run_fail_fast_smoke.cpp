#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using gridrun::core::errors::ExitCode;
using gridrun::core::errors::ToInt;
using gridrun::tests::common::AssertContains;
using gridrun::tests::common::AssertExitCode;
using gridrun::tests::common::AssertNotContains;
using gridrun::tests::common::CountEventType;
using gridrun::tests::common::Fail;
using gridrun::tests::common::ReadFileToString;
using gridrun::tests::common::ReadNonEmptyLines;

namespace {

std::string MakePipeline(const fs::path& marker_dir) {
  return R"JSON({
  "schema_version": "1.0",
  "pipeline_id": "fail_fast_smoke",
  "env": {"MARKERS": ")JSON" +
         marker_dir.string() + R"JSON("},
  "jobs": {
    "test": {
      "runs-on": "ubuntu-latest",
      "strategy": {"matrix": {"shard": [1, 2, 3]}},
      "steps": [
        {"run": "echo shard-${{ matrix.shard }} >> \"$MARKERS/started.txt\"; test ${{ matrix.shard }} -ne 1"},
        {"run": "echo teardown-${{ matrix.shard }} >> \"$MARKERS/teardown.txt\"", "if": "always()"}
      ]
    }
  }
})JSON";
}

struct RunObservation {
  std::vector<std::string> started;
  std::vector<std::string> teardown;
  std::string report;
  std::vector<std::string> events;
};

RunObservation RunOnce(const fs::path& root, const std::vector<std::string>& extra_args) {
  const fs::path marker_dir = root / "markers";
  fs::create_directories(marker_dir);
  const fs::path pipeline_path = root / "pipeline.json";
  gridrun::tests::common::WritePipelineFile(pipeline_path, MakePipeline(marker_dir));

  // One worker keeps the order deterministic: shard 1 fails before 2 and 3 start.
  std::vector<std::string> args = {"--jobs", "1"};
  args.insert(args.end(), extra_args.begin(), extra_args.end());
  AssertExitCode(gridrun::tests::common::DispatchRunPipeline(pipeline_path, root / "out", args),
                 ToInt(ExitCode::kJobsFailed), "run with a failing shard");

  const fs::path run_dir = gridrun::tests::common::RequireSingleRunDir(root / "out");
  RunObservation observation;
  observation.started = ReadNonEmptyLines(marker_dir / "started.txt");
  observation.teardown = ReadNonEmptyLines(marker_dir / "teardown.txt");
  observation.report = ReadFileToString(run_dir / "report.json");
  observation.events = ReadNonEmptyLines(run_dir / "events.jsonl");
  AssertContains(ReadFileToString(run_dir / "summary.md"), "**FAILURE**");
  return observation;
}

} // namespace

int main() {
  const fs::path temp_root = gridrun::tests::common::CreateUniqueTempDir("gridrun-fail-fast");

  const RunObservation fail_fast = RunOnce(temp_root / "default", {});
  if (fail_fast.started != std::vector<std::string>{"shard-1"}) {
    Fail("fail-fast should stop siblings before their first step");
  }
  // always() cleanup still runs inside cancelled siblings.
  if (fail_fast.teardown.size() != 3U) {
    Fail("every job should run its always() teardown");
  }
  AssertContains(fail_fast.report, "\"failed\":1");
  AssertContains(fail_fast.report, "\"cancelled_jobs\":2");
  AssertContains(fail_fast.report, "\"cancelled\":true");
  AssertContains(fail_fast.report, "\"status\":\"cancelled\"");
  if (CountEventType(fail_fast.events, "cancel_requested") != 1U) {
    Fail("fail-fast should emit exactly one cancel_requested event");
  }

  const RunObservation no_fail_fast = RunOnce(temp_root / "no_fail_fast", {"--no-fail-fast"});
  if (no_fail_fast.started.size() != 3U) {
    Fail("--no-fail-fast should let every shard start");
  }
  AssertContains(no_fail_fast.report, "\"failed\":1");
  AssertContains(no_fail_fast.report, "\"succeeded\":2");
  AssertContains(no_fail_fast.report, "\"cancelled\":false");
  AssertNotContains(no_fail_fast.report, "\"status\":\"cancelled\"");
  if (CountEventType(no_fail_fast.events, "cancel_requested") != 0U) {
    Fail("--no-fail-fast should not request cancellation");
  }

  gridrun::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}
