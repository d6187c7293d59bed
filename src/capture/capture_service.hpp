#pragma once

#include "camera/profile_manager.hpp"
#include "config/settings_model.hpp"
#include "storage/quota_enforcer.hpp"
#include "sun/sun_phase.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::config {
class ISettingsStore;
}

namespace cosmicam::camera {
class ICaptureBackend;
class IImageProcessor;
} // namespace cosmicam::camera

namespace cosmicam::events {
class Emitter;
}

namespace cosmicam::capture {

constexpr std::chrono::milliseconds kDefaultRetryDelay{5000};

struct CaptureServiceOptions {
  std::filesystem::path image_dir;
  // Wait after a failed capture. Never longer than the capture interval.
  std::chrono::milliseconds retry_delay = kDefaultRetryDelay;
};

// What one loop cycle did and how long the loop should wait before the next.
struct IterationResult {
  bool capture_succeeded = false;
  std::filesystem::path artifact_path;
  std::string error;
  std::string profile_name;
  sun::SunPhaseResult phase;
  storage::QuotaReport quota;
  std::chrono::milliseconds next_delay{0};
};

struct CaptureCounters {
  std::uint64_t cycles = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  std::uint64_t consecutive_failures = 0;
  std::filesystem::path last_artifact;
};

// Periodic capture loop with two states, stopped and running.
//
// Each cycle re-reads the system settings, lets the profile manager follow
// the sun, captures with the active profile and, after a success, keeps the
// image directory under quota. A failed capture is retried after the short
// retry delay; nothing but Stop() ends the loop.
class CaptureService {
public:
  CaptureService(CaptureServiceOptions options, config::ISettingsStore& store,
                 camera::CameraProfileManager& profiles, camera::ICaptureBackend& backend,
                 camera::IImageProcessor& processor, core::logging::Logger& logger,
                 events::Emitter* emitter = nullptr, camera::WallClock clock = {});

  CaptureService(const CaptureService&) = delete;
  CaptureService& operator=(const CaptureService&) = delete;

  // Runs the loop on the calling thread until Stop(). Fails without
  // entering the loop when already running or when the image directory
  // cannot be created. A Stop() that arrives before Start() makes it return
  // after zero cycles.
  bool Start(std::string& error);

  // Safe from any thread. Wakes a sleeping loop at once; a capture already
  // in flight finishes first.
  void Stop();

  bool IsRunning() const;

  // One full cycle, independent of the loop state.
  IterationResult RunIteration();

  CaptureCounters Counters() const;
  config::SystemSettings CurrentSystemSettings() const;

private:
  void ReloadSystemSettings();
  void EmitLifecycle(bool started) const;

  CaptureServiceOptions options_;
  config::ISettingsStore& store_;
  camera::CameraProfileManager& profiles_;
  camera::ICaptureBackend& backend_;
  camera::IImageProcessor& processor_;
  core::logging::Logger& logger_;
  events::Emitter* emitter_ = nullptr;
  camera::WallClock clock_;
  storage::QuotaEnforcer quota_;

  mutable std::mutex mu_;
  std::condition_variable wake_;
  bool running_ = false;
  bool stop_requested_ = false;
  config::SystemSettings settings_;
  CaptureCounters counters_;
};

} // namespace cosmicam::capture
