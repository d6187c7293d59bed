#include "events/emitter.hpp"

#include "core/json_utils.hpp"

#include <utility>

namespace cosmicam::events {

Emitter::Emitter(IEventSink* sink) : sink_(sink) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  if (sink_ == nullptr) {
    return true;
  }
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  return sink_->Append(event, error);
}

bool Emitter::EmitServiceLifecycle(const ServiceLifecycleEvent& event, std::string& error) const {
  return EmitRaw(event.started ? EventType::kServiceStarted : EventType::kServiceStopped, event.ts,
                 {
                     {"image_dir", event.image_dir},
                     {"cycles", std::to_string(event.cycles)},
                 },
                 error);
}

bool Emitter::EmitProfileChanged(const ProfileChangedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"old_profile", event.old_profile},
      {"new_profile", event.new_profile},
      {"sun_phase", event.sun_phase},
      {"altitude_deg", core::FormatJsonNumber(event.altitude_degrees)},
  };

  // Prefixed so profile parameters never collide with the fields above.
  for (const auto& [key, value] : event.settings) {
    payload["setting." + key] = value;
  }
  return EmitRaw(EventType::kProfileChanged, event.ts, std::move(payload), error);
}

bool Emitter::EmitProfileUnmatched(const ProfileUnmatchedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kProfileUnmatched, event.ts,
                 {
                     {"sun_phase", event.sun_phase},
                     {"kept_profile", event.kept_profile},
                 },
                 error);
}

bool Emitter::EmitCaptureSucceeded(const CaptureSucceededEvent& event, std::string& error) const {
  return EmitRaw(EventType::kCaptureSucceeded, event.ts,
                 {
                     {"artifact_path", event.artifact_path},
                     {"profile", event.profile},
                     {"sun_phase", event.sun_phase},
                     {"duration_ms", std::to_string(event.duration_ms)},
                 },
                 error);
}

bool Emitter::EmitCaptureFailed(const CaptureFailedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kCaptureFailed, event.ts,
                 {
                     {"profile", event.profile},
                     {"error", event.error},
                     {"consecutive_failures", std::to_string(event.consecutive_failures)},
                     {"retry_delay_ms", std::to_string(event.retry_delay_ms)},
                 },
                 error);
}

bool Emitter::EmitQuotaEnforced(const QuotaEnforcedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kQuotaEnforced, event.ts,
                 {
                     {"usage_before_bytes", std::to_string(event.usage_before_bytes)},
                     {"max_bytes", std::to_string(event.max_bytes)},
                     {"bytes_to_free", std::to_string(event.bytes_to_free)},
                     {"bytes_reclaimed", std::to_string(event.bytes_reclaimed)},
                     {"files_deleted", std::to_string(event.files_deleted)},
                     {"deletion_failures", std::to_string(event.deletion_failures)},
                 },
                 error);
}

} // namespace cosmicam::events
