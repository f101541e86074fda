#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace gridrun::events {

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Contract:
// - `Open` creates `output_dir` if needed and opens the file in append mode.
// - `Append` writes exactly one flushed line per call; concurrent callers
//   never interleave within a line.
// - Both return false with `error` populated on failure.
class JsonlEventWriter {
public:
  bool Open(const std::filesystem::path& output_dir, std::string& error);
  bool Append(const Event& event, std::string& error);

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::mutex mutex_;
  std::ofstream out_;
  std::filesystem::path path_;
};

} // namespace gridrun::events
