#include "artifacts/report_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "matrix/matrix_resolver.hpp"

#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace gridrun::artifacts {

namespace {

using core::JsonBool;
using core::JsonString;

template <typename T>
void WriteOptional(std::ostringstream& out, const std::optional<T>& value) {
  if (value.has_value()) {
    out << value.value();
  } else {
    out << "null";
  }
}

void WriteStringArray(std::ostringstream& out, const std::vector<std::string>& values) {
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << JsonString(values[i]);
  }
  out << ']';
}

void WriteStep(std::ostringstream& out, const execution::StepResult& step) {
  out << "{"
      << "\"index\":" << step.index << ","
      << "\"id\":" << JsonString(step.id) << ","
      << "\"name\":" << JsonString(step.name) << ","
      << "\"action\":" << JsonString(step.action) << ","
      << "\"policy\":" << JsonString(planner::ToString(step.policy)) << ","
      << "\"status\":" << JsonString(execution::ToString(step.status)) << ","
      << "\"skip_reason\":";
  if (step.status == execution::StepStatus::kSkipped) {
    out << JsonString(execution::ToString(step.skip_reason));
  } else {
    out << "null";
  }
  out << ",\"exit_code\":";
  WriteOptional(out, step.exit_code);
  out << ",\"duration_ms\":" << step.duration_ms << ","
      << "\"diagnostic\":" << JsonString(step.diagnostic) << ","
      << "\"log_path\":" << JsonString(step.log_path.generic_string()) << "}";
}

void WriteJob(std::ostringstream& out, const execution::JobOutcome& job) {
  out << "{"
      << "\"id\":" << JsonString(job.job_id) << ","
      << "\"template\":" << JsonString(job.template_name) << ","
      << "\"name\":" << JsonString(job.display_name) << ","
      << "\"matrix\":" << core::json::Serialize(job.matrix) << ","
      << "\"runner_label\":" << JsonString(job.runner_label) << ","
      << "\"runner_os\":" << JsonString(job.runner_os) << ","
      << "\"status\":" << JsonString(execution::ToString(job.status)) << ","
      << "\"stopped_at\":";
  WriteOptional(out, job.stopped_at);
  out << ",\"tolerated_failures\":" << job.tolerated_failures << ","
      << "\"duration_ms\":" << job.duration_ms << ","
      << "\"diagnostics\":";
  WriteStringArray(out, job.diagnostics);
  out << ",\"steps\":[";
  for (std::size_t i = 0; i < job.steps.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    WriteStep(out, job.steps[i]);
  }
  out << "]}";
}

} // namespace

std::string BuildReportJson(const core::schema::RunInfo& run_info,
                            const execution::PipelineResult& result,
                            const std::vector<planner::JobPlan>& plans) {
  std::ostringstream out;
  out << "{"
      << "\"run\":" << core::schema::ToJson(run_info) << ","
      << "\"result\":{"
      << "\"success\":" << JsonBool(result.success) << ","
      << "\"cancelled\":" << JsonBool(result.cancelled) << ","
      << "\"jobs_total\":" << result.jobs.size() << ","
      << "\"succeeded\":" << result.succeeded_count << ","
      << "\"failed\":" << result.failed_count << ","
      << "\"cancelled_jobs\":" << result.cancelled_count << ","
      << "\"unplannable\":" << result.unplannable.size() << "},";

  out << "\"jobs\":[";
  for (std::size_t i = 0; i < result.jobs.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    WriteJob(out, result.jobs[i]);
  }
  out << "],";

  out << "\"unplannable\":[";
  for (std::size_t i = 0; i < result.unplannable.size(); ++i) {
    const planner::UnplannableJob& job = result.unplannable[i];
    if (i != 0U) {
      out << ',';
    }
    out << "{"
        << "\"id\":" << JsonString(job.id) << ","
        << "\"template\":" << JsonString(job.template_name) << ","
        << "\"name\":" << JsonString(job.display_name) << ","
        << "\"matrix\":" << core::json::Serialize(job.combination.ToObject()) << ","
        << "\"reason\":" << JsonString(job.reason) << "}";
  }
  out << "],";

  out << "\"matrix_diagnostics\":[";
  bool first = true;
  for (const auto& plan : plans) {
    for (const auto& diagnostic : plan.diagnostics) {
      if (!first) {
        out << ',';
      }
      first = false;
      out << "{"
          << "\"template\":" << JsonString(plan.template_name) << ","
          << "\"kind\":" << JsonString(matrix::ToString(diagnostic.kind)) << ","
          << "\"source\":" << JsonString(diagnostic.source) << ","
          << "\"message\":" << JsonString(diagnostic.message) << "}";
    }
  }
  out << "]}";
  return out.str();
}

bool WriteReportJson(const core::schema::RunInfo& run_info,
                     const execution::PipelineResult& result,
                     const std::vector<planner::JobPlan>& plans, const fs::path& output_dir,
                     fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  written_path = output_dir / "report.json";
  // Trailing newline keeps the file shell-friendly (`cat`, `tail`, diffs).
  return core::WriteTextFileAtomic(written_path, BuildReportJson(run_info, result, plans) + "\n",
                                   error);
}

} // namespace gridrun::artifacts
