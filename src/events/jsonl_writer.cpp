#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace cosmicam::events {

bool AppendEventJsonl(const Event& event, const fs::path& events_path, std::string& error) {
  if (!core::EnsureParentDirectory(events_path, error)) {
    return false;
  }

  std::ofstream out_file(events_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + events_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + events_path.string() + "'";
    return false;
  }

  return true;
}

JsonlEventSink::JsonlEventSink(fs::path events_path) : events_path_(std::move(events_path)) {}

bool JsonlEventSink::Append(const Event& event, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  return AppendEventJsonl(event, events_path_, error);
}

} // namespace cosmicam::events
