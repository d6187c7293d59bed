#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace cosmicam::events {

// Destination for timeline events.
class IEventSink {
public:
  virtual ~IEventSink() = default;

  virtual bool Append(const Event& event, std::string& error) = 0;
};

// Appends one JSON-serialized event per line to a JSONL file.
//
// Contract:
// - Creates the parent directory if needed.
// - Opens the file in append mode per call, so external log rotation that
//   moves the file away is picked up on the next event.
// - Writes exactly one line per call.
// - Returns false with `error` populated on failure.
class JsonlEventSink final : public IEventSink {
public:
  explicit JsonlEventSink(std::filesystem::path events_path);

  bool Append(const Event& event, std::string& error) override;

  const std::filesystem::path& path() const {
    return events_path_;
  }

private:
  std::filesystem::path events_path_;
  std::mutex mu_;
};

bool AppendEventJsonl(const Event& event, const std::filesystem::path& events_path,
                      std::string& error);

} // namespace cosmicam::events
