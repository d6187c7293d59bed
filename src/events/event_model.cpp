#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace cosmicam::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kServiceStarted:
    return "service_started";
  case EventType::kServiceStopped:
    return "service_stopped";
  case EventType::kProfileChanged:
    return "profile_changed";
  case EventType::kProfileUnmatched:
    return "profile_unmatched";
  case EventType::kCaptureSucceeded:
    return "capture_succeeded";
  case EventType::kCaptureFailed:
    return "capture_failed";
  case EventType::kQuotaEnforced:
    return "quota_enforced";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // std::map iteration keeps payload keys sorted, so identical events
  // serialize to identical lines.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << "\"" << core::EscapeJson(key) << "\":\"" << core::EscapeJson(value) << "\"";
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace cosmicam::events
