#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace gridrun::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kPipelineStarted:
    return "pipeline_started";
  case EventType::kJobPlanned:
    return "job_planned";
  case EventType::kJobUnplannable:
    return "job_unplannable";
  case EventType::kJobStarted:
    return "job_started";
  case EventType::kStepStarted:
    return "step_started";
  case EventType::kStepFinished:
    return "step_finished";
  case EventType::kJobFinished:
    return "job_finished";
  case EventType::kCancelRequested:
    return "cancel_requested";
  case EventType::kPipelineFinished:
    return "pipeline_finished";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":" << core::JsonString(core::FormatUtcTimestamp(event.ts)) << ","
      << "\"type\":" << core::JsonString(ToJson(event.type)) << ","
      << "\"payload\":{";

  // std::map keeps payload keys sorted, so lines diff cleanly.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::JsonString(key) << ':' << core::JsonString(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace gridrun::events
