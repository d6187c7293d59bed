#pragma once

#include "config/settings_model.hpp"
#include "config/settings_store.hpp"
#include "sun/sun_phase.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::events {
class Emitter;
}

namespace cosmicam::camera {

using WallClock = std::function<std::chrono::system_clock::time_point()>;

// Owns the name of the active camera profile and switches it to follow the
// sun. Profiles and coordinates live in the settings store; every operation
// that depends on them reads the store again first, so edits made by another
// process apply on the next call.
//
// Store read failures never surface as errors here. At construction they fall
// back to built-in defaults, later they keep the last values that did load.
// Either way a warning is logged.
class CameraProfileManager {
public:
  CameraProfileManager(config::ISettingsStore& store, core::logging::Logger& logger,
                       events::Emitter* emitter = nullptr, WallClock clock = {});

  CameraProfileManager(const CameraProfileManager&) = delete;
  CameraProfileManager& operator=(const CameraProfileManager&) = delete;

  // Computes the current sun phase and activates the profile named after
  // it. `profile_changed` is emitted only when the active name changes. A
  // phase with no profile keeps the active one and emits `profile_unmatched`
  // once per phase.
  sun::SunPhaseResult RefreshFromSunPhase();

  // Parameters of the active profile, or of `default` when the active name
  // has been removed from the store.
  config::CameraProfile CurrentSettings();

  // Merges `patch` into profile `name`, creating it from `default` values
  // when absent, and persists the whole mapping. A failed write leaves the
  // merge in memory.
  bool UpdateProfile(const std::string& name, const config::CameraProfilePatch& patch,
                     std::string& error);

  // Manual override until the next refresh. False, with nothing changed,
  // when no such profile exists.
  bool SwitchProfile(const std::string& name);

  // Validates and persists new coordinates. Callers refresh afterwards.
  bool UpdateCoordinates(double latitude, double longitude, std::string& error);

  std::string CurrentProfileName() const;
  config::ProfileMap Profiles() const;
  sun::GeoCoordinates Coordinates() const;
  std::optional<sun::SunPhaseResult> LastPhase() const;

private:
  void ReloadProfilesLocked();
  void ReloadCoordinatesLocked();
  void EmitChangedLocked(const std::string& old_name, const sun::SunPhaseResult& phase,
                         std::chrono::system_clock::time_point now);
  void EmitUnmatchedLocked(const sun::SunPhaseResult& phase,
                           std::chrono::system_clock::time_point now);

  config::ISettingsStore& store_;
  core::logging::Logger& logger_;
  events::Emitter* emitter_ = nullptr;
  WallClock clock_;

  mutable std::mutex mu_;
  std::string current_profile_name_ = std::string(config::kDefaultProfileName);
  config::ProfileMap profiles_;
  sun::GeoCoordinates coordinates_;
  std::optional<sun::SunPhaseResult> last_phase_;
  std::optional<sun::SunPhase> unmatched_phase_;
};

} // namespace cosmicam::camera
