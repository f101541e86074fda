#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gridrun::pipeline {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Validates pipeline JSON text against the document schema.
//
// Contract:
// - Returns true when validation completed (even if the document is invalid).
// - Populates `report.valid` and `report.issues`.
// - On parse errors, emits an actionable issue under path `$`.
// - Step conditions are not parsed here; a malformed `if` is reported when the
//   step is reached at run time.
bool ValidatePipelineText(std::string_view json_text, ValidationReport& report,
                          std::string& error);

// Loads and validates a pipeline file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidatePipelineFile(const std::string& pipeline_path, ValidationReport& report,
                          std::string& error);

} // namespace gridrun::pipeline
