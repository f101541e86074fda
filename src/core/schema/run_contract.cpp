#include "core/schema/run_contract.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace gridrun::core::schema {

std::string ToJson(const RunConfig& run_config) {
  std::ostringstream out;
  out << "{"
      << "\"pipeline_id\":" << JsonString(run_config.pipeline_id) << ","
      << "\"pipeline_path\":" << JsonString(run_config.pipeline_path) << ","
      << "\"action_runner\":" << JsonString(run_config.action_runner) << ","
      << "\"max_parallel\":" << run_config.max_parallel << ","
      << "\"fail_fast_override\":";
  if (run_config.fail_fast_override.has_value()) {
    out << JsonBool(run_config.fail_fast_override.value());
  } else {
    out << "null";
  }
  out << ",\"job_filter\":";
  if (run_config.job_filter.has_value()) {
    out << JsonString(run_config.job_filter.value());
  } else {
    out << "null";
  }
  out << "}";
  return out.str();
}

std::string ToJson(const RunTimestamps& timestamps) {
  std::ostringstream out;
  out << "{"
      << "\"created_at_utc\":" << JsonString(FormatUtcTimestamp(timestamps.created_at)) << ","
      << "\"started_at_utc\":" << JsonString(FormatUtcTimestamp(timestamps.started_at)) << ","
      << "\"finished_at_utc\":" << JsonString(FormatUtcTimestamp(timestamps.finished_at))
      << "}";
  return out.str();
}

std::string ToJson(const RunInfo& run_info) {
  std::ostringstream out;
  out << "{"
      << "\"run_id\":" << JsonString(run_info.run_id) << ","
      << "\"config\":" << ToJson(run_info.config) << ","
      << "\"timestamps\":" << ToJson(run_info.timestamps) << "}";
  return out.str();
}

} // namespace gridrun::core::schema
