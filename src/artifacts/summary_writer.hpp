#pragma once

#include "core/schema/run_contract.hpp"
#include "execution/pipeline_runner.hpp"

#include <filesystem>
#include <string>

namespace gridrun::artifacts {

// Renders the one-page human-readable summary.
std::string BuildSummaryMarkdown(const core::schema::RunInfo& run_info,
                                 const execution::PipelineResult& result);

// Writes `summary.md`.
//
// Contract:
// - creates `output_dir` when missing.
// - writes `<output_dir>/summary.md` atomically.
// - lists every job with status, stop point and tolerated failures, then the
//   failed and skipped steps worth a look, then unplannable jobs.
// - returns false and sets `error` on failure.
bool WriteSummaryMarkdown(const core::schema::RunInfo& run_info,
                          const execution::PipelineResult& result,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace gridrun::artifacts
