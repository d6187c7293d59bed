#pragma once

#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace cosmicam::events {

// Typed facade over an event sink so every producer builds the same payload
// keys for the same event. A null sink turns every call into a successful
// no-op, which is how the service runs with the timeline disabled.
class Emitter {
public:
  struct ServiceLifecycleEvent {
    std::chrono::system_clock::time_point ts{};
    bool started = true;
    std::string image_dir;
    std::uint64_t cycles = 0;
  };

  struct ProfileChangedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string old_profile;
    std::string new_profile;
    std::string sun_phase;
    double altitude_degrees = 0.0;
    std::map<std::string, std::string> settings;
  };

  struct ProfileUnmatchedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string sun_phase;
    std::string kept_profile;
  };

  struct CaptureSucceededEvent {
    std::chrono::system_clock::time_point ts{};
    std::string artifact_path;
    std::string profile;
    std::string sun_phase;
    std::uint64_t duration_ms = 0;
  };

  struct CaptureFailedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string profile;
    std::string error;
    std::uint64_t consecutive_failures = 0;
    std::uint64_t retry_delay_ms = 0;
  };

  struct QuotaEnforcedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t usage_before_bytes = 0;
    std::uint64_t max_bytes = 0;
    std::uint64_t bytes_to_free = 0;
    std::uint64_t bytes_reclaimed = 0;
    std::uint64_t files_deleted = 0;
    std::uint64_t deletion_failures = 0;
  };

  explicit Emitter(IEventSink* sink = nullptr);

  bool enabled() const {
    return sink_ != nullptr;
  }

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitServiceLifecycle(const ServiceLifecycleEvent& event, std::string& error) const;
  bool EmitProfileChanged(const ProfileChangedEvent& event, std::string& error) const;
  bool EmitProfileUnmatched(const ProfileUnmatchedEvent& event, std::string& error) const;
  bool EmitCaptureSucceeded(const CaptureSucceededEvent& event, std::string& error) const;
  bool EmitCaptureFailed(const CaptureFailedEvent& event, std::string& error) const;
  bool EmitQuotaEnforced(const QuotaEnforcedEvent& event, std::string& error) const;

private:
  IEventSink* sink_ = nullptr;
};

} // namespace cosmicam::events
