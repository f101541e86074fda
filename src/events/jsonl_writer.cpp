#include "events/jsonl_writer.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace gridrun::events {

bool JsonlEventWriter::Open(const fs::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }

  const std::lock_guard<std::mutex> lock(mutex_);
  path_ = output_dir / "events.jsonl";
  out_.open(path_, std::ios::binary | std::ios::app);
  if (!out_) {
    error = "failed to open event log '" + path_.string() + "' for append";
    return false;
  }
  return true;
}

bool JsonlEventWriter::Append(const Event& event, std::string& error) {
  const std::string line = ToJson(event);

  const std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open()) {
    error = "event log is not open";
    return false;
  }
  out_ << line << '\n';
  out_.flush();
  if (!out_) {
    error = "failed while writing event log '" + path_.string() + "'";
    return false;
  }
  return true;
}

} // namespace gridrun::events
