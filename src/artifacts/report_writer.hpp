#pragma once

#include "core/schema/run_contract.hpp"
#include "execution/pipeline_runner.hpp"
#include "planner/job_planner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gridrun::artifacts {

// Serializes the machine-readable run report: run header, aggregate result,
// every job with its ordered step outcomes, unplannable jobs and matrix
// resolution diagnostics. Job order follows the plan.
std::string BuildReportJson(const core::schema::RunInfo& run_info,
                            const execution::PipelineResult& result,
                            const std::vector<planner::JobPlan>& plans);

// Emits `report.json` for a run.
//
// Contract:
// - Creates `output_dir` if needed.
// - Writes `<output_dir>/report.json` atomically.
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteReportJson(const core::schema::RunInfo& run_info,
                     const execution::PipelineResult& result,
                     const std::vector<planner::JobPlan>& plans,
                     const std::filesystem::path& output_dir, std::filesystem::path& written_path,
                     std::string& error);

} // namespace gridrun::artifacts
