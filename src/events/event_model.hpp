#pragma once

#include <chrono>
#include <map>
#include <string>

namespace cosmicam::events {

// Timeline event categories emitted by the capture loop. The JSON spellings
// are what external readers of `events.jsonl` match on, so keep them stable.
enum class EventType {
  kServiceStarted,
  kServiceStopped,
  kProfileChanged,
  kProfileUnmatched,
  kCaptureSucceeded,
  kCaptureFailed,
  kQuotaEnforced,
};

// - `ts`: UTC timestamp when the event occurred.
// - `type`: category.
// - `payload`: flat string attributes.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kServiceStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace cosmicam::events
