#pragma once

#include <chrono>
#include <map>
#include <string>

namespace gridrun::events {

// Timeline event categories written to `events.jsonl`. Keep this enum stable;
// downstream tooling keys off the serialized names.
enum class EventType {
  kPipelineStarted,
  kJobPlanned,
  kJobUnplannable,
  kJobStarted,
  kStepStarted,
  kStepFinished,
  kJobFinished,
  kCancelRequested,
  kPipelineFinished,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kPipelineStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace gridrun::events
