#include "artifacts/summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace gridrun::artifacts {

namespace {

// Table cells must not break the markdown row.
std::string EscapeCell(std::string_view text) {
  std::string escaped;
  for (const char c : text) {
    if (c == '|') {
      escaped += "\\|";
    } else if (c == '\n' || c == '\r') {
      escaped.push_back(' ');
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

const char* StatusBadge(execution::JobStatus status) {
  switch (status) {
  case execution::JobStatus::kSucceeded:
    return "PASS";
  case execution::JobStatus::kFailed:
    return "FAIL";
  case execution::JobStatus::kCancelled:
    return "CANCELLED";
  default:
    return "-";
  }
}

void WriteJobsTable(std::ostringstream& out, const execution::PipelineResult& result) {
  out << "## Jobs\n\n";
  if (result.jobs.empty()) {
    out << "- No jobs ran.\n\n";
    return;
  }
  out << "| Job | Runner | Status | Stopped at | Tolerated failures | Duration (ms) |\n";
  out << "| --- | --- | --- | --- | --- | --- |\n";
  for (const auto& job : result.jobs) {
    out << "| " << EscapeCell(job.display_name) << " | " << EscapeCell(job.runner_label) << " ("
        << job.runner_os << ") | " << StatusBadge(job.status) << " | ";
    if (job.stopped_at.has_value()) {
      const std::size_t index = job.stopped_at.value();
      out << "step " << index + 1U;
      if (index < job.steps.size()) {
        out << ": " << EscapeCell(job.steps[index].name);
      }
    } else {
      out << "-";
    }
    out << " | " << job.tolerated_failures << " | " << job.duration_ms << " |\n";
  }
  out << '\n';
}

void WriteStepFindings(std::ostringstream& out, const execution::PipelineResult& result) {
  out << "## Step Findings\n\n";
  bool any = false;
  for (const auto& job : result.jobs) {
    for (const auto& step : job.steps) {
      const bool failed = step.status == execution::StepStatus::kFailed;
      const bool notable_skip =
          step.status == execution::StepStatus::kSkipped &&
          step.skip_reason == execution::SkipReason::kConditionError;
      if (!failed && !notable_skip) {
        continue;
      }
      any = true;
      out << "- `" << job.job_id << "` step " << step.index + 1U << " `" << step.name << "`: "
          << execution::ToString(step.status);
      if (failed) {
        out << " (" << planner::ToString(step.policy);
        if (step.exit_code.has_value()) {
          out << ", exit " << step.exit_code.value();
        }
        out << ")";
      } else {
        out << " (" << execution::ToString(step.skip_reason) << ")";
      }
      if (!step.diagnostic.empty()) {
        out << " - " << step.diagnostic;
      }
      out << '\n';
    }
  }
  if (!any) {
    out << "- No failed steps.\n";
  }
  out << '\n';
}

void WriteUnplannable(std::ostringstream& out, const execution::PipelineResult& result) {
  if (result.unplannable.empty()) {
    return;
  }
  out << "## Unplannable Jobs\n\n";
  for (const auto& job : result.unplannable) {
    out << "- `" << job.id << "` " << job.display_name << ": " << job.reason << '\n';
  }
  out << '\n';
}

} // namespace

std::string BuildSummaryMarkdown(const core::schema::RunInfo& run_info,
                                 const execution::PipelineResult& result) {
  std::ostringstream out;
  out << "# Pipeline Run Summary\n\n";
  out << "## Status\n\n";
  out << "**" << (result.success ? "SUCCESS" : "FAILURE") << "**";
  if (result.cancelled) {
    out << " (cancellation requested)";
  }
  out << "\n\n";

  out << "- jobs: " << result.jobs.size() << " (" << result.succeeded_count << " succeeded, "
      << result.failed_count << " failed, " << result.cancelled_count << " cancelled)\n";
  out << "- unplannable: " << result.unplannable.size() << "\n\n";

  out << "## Run Identity\n\n";
  out << "- run_id: `" << run_info.run_id << "`\n";
  out << "- pipeline_id: `" << run_info.config.pipeline_id << "`\n";
  out << "- action_runner: `" << run_info.config.action_runner << "`\n";
  out << "- started_at_utc: `" << core::FormatUtcTimestamp(run_info.timestamps.started_at)
      << "`\n";
  out << "- finished_at_utc: `" << core::FormatUtcTimestamp(run_info.timestamps.finished_at)
      << "`\n\n";

  WriteJobsTable(out, result);
  WriteStepFindings(out, result);
  WriteUnplannable(out, result);
  return out.str();
}

bool WriteSummaryMarkdown(const core::schema::RunInfo& run_info,
                          const execution::PipelineResult& result, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  written_path = output_dir / "summary.md";
  return core::WriteTextFileAtomic(written_path, BuildSummaryMarkdown(run_info, result), error);
}

} // namespace gridrun::artifacts
