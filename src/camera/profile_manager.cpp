#include "camera/profile_manager.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"

#include <utility>

namespace cosmicam::camera {

namespace {

config::CameraProfile DefaultEntry(const config::ProfileMap& profiles) {
  const std::string name(config::kDefaultProfileName);
  const auto it = profiles.find(name);
  if (it != profiles.end()) {
    return it->second;
  }
  return config::DefaultProfiles().at(name);
}

} // namespace

CameraProfileManager::CameraProfileManager(config::ISettingsStore& store,
                                           core::logging::Logger& logger,
                                           events::Emitter* emitter, WallClock clock)
    : store_(store), logger_(logger), emitter_(emitter), clock_(std::move(clock)),
      profiles_(config::DefaultProfiles()), coordinates_(config::DefaultCoordinates()) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }

  std::lock_guard<std::mutex> lock(mu_);
  ReloadCoordinatesLocked();
  ReloadProfilesLocked();
}

void CameraProfileManager::ReloadProfilesLocked() {
  config::ProfileMap loaded;
  std::string error;
  if (!config::ReadProfiles(store_, loaded, error)) {
    logger_.Warn("camera profiles unavailable, keeping current set", {{"error", error}});
    return;
  }
  profiles_ = std::move(loaded);
}

void CameraProfileManager::ReloadCoordinatesLocked() {
  sun::GeoCoordinates loaded;
  std::string error;
  if (!config::ReadCoordinates(store_, loaded, error)) {
    logger_.Warn("coordinates unavailable, keeping current values", {{"error", error}});
    return;
  }
  coordinates_ = loaded;
}

sun::SunPhaseResult CameraProfileManager::RefreshFromSunPhase() {
  const auto now = clock_();

  std::lock_guard<std::mutex> lock(mu_);
  ReloadCoordinatesLocked();
  ReloadProfilesLocked();

  const sun::SunPhaseResult phase = sun::ComputeSunPhase(now, coordinates_, logger_);
  last_phase_ = phase;

  const std::string phase_name = sun::ToString(phase.phase);
  if (profiles_.find(phase_name) == profiles_.end()) {
    if (!unmatched_phase_.has_value() || *unmatched_phase_ != phase.phase) {
      unmatched_phase_ = phase.phase;
      logger_.Info("no camera profile for sun phase",
                   {{"sun_phase", phase_name}, {"kept_profile", current_profile_name_}});
      EmitUnmatchedLocked(phase, now);
    }
    return phase;
  }
  unmatched_phase_.reset();

  if (phase_name == current_profile_name_) {
    return phase;
  }

  const std::string old_name = current_profile_name_;
  current_profile_name_ = phase_name;
  logger_.Info("camera profile switched",
               {{"old_profile", old_name},
                {"new_profile", current_profile_name_},
                {"altitude_deg", core::FormatJsonNumber(phase.altitude_degrees)},
                {"settings", config::Describe(profiles_.at(current_profile_name_))}});
  EmitChangedLocked(old_name, phase, now);
  return phase;
}

void CameraProfileManager::EmitChangedLocked(const std::string& old_name,
                                             const sun::SunPhaseResult& phase,
                                             const std::chrono::system_clock::time_point now) {
  if (emitter_ == nullptr) {
    return;
  }
  events::Emitter::ProfileChangedEvent event;
  event.ts = now;
  event.old_profile = old_name;
  event.new_profile = current_profile_name_;
  event.sun_phase = sun::ToString(phase.phase);
  event.altitude_degrees = phase.altitude_degrees;
  event.settings = config::DescribeFields(profiles_.at(current_profile_name_));

  std::string error;
  if (!emitter_->EmitProfileChanged(event, error)) {
    logger_.Warn("failed to record profile change event", {{"error", error}});
  }
}

void CameraProfileManager::EmitUnmatchedLocked(const sun::SunPhaseResult& phase,
                                               const std::chrono::system_clock::time_point now) {
  if (emitter_ == nullptr) {
    return;
  }
  events::Emitter::ProfileUnmatchedEvent event;
  event.ts = now;
  event.sun_phase = sun::ToString(phase.phase);
  event.kept_profile = current_profile_name_;

  std::string error;
  if (!emitter_->EmitProfileUnmatched(event, error)) {
    logger_.Warn("failed to record unmatched phase event", {{"error", error}});
  }
}

config::CameraProfile CameraProfileManager::CurrentSettings() {
  std::lock_guard<std::mutex> lock(mu_);
  ReloadProfilesLocked();

  const auto it = profiles_.find(current_profile_name_);
  if (it != profiles_.end()) {
    return it->second;
  }
  logger_.Warn("active camera profile no longer exists, using default",
               {{"profile", current_profile_name_}});
  return DefaultEntry(profiles_);
}

bool CameraProfileManager::UpdateProfile(const std::string& name,
                                         const config::CameraProfilePatch& patch,
                                         std::string& error) {
  error.clear();
  if (name.empty()) {
    error = "profile name must not be empty";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  ReloadProfilesLocked();

  auto it = profiles_.find(name);
  if (it == profiles_.end()) {
    it = profiles_.emplace(name, DefaultEntry(profiles_)).first;
    logger_.Info("creating camera profile", {{"profile", name}});
  }
  config::ApplyPatch(it->second, patch);

  if (!config::WriteProfiles(store_, profiles_, error)) {
    logger_.Error("failed to persist camera profiles", {{"profile", name}, {"error", error}});
    return false;
  }
  logger_.Info("camera profile updated",
               {{"profile", name}, {"settings", config::Describe(it->second)}});
  return true;
}

bool CameraProfileManager::SwitchProfile(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  ReloadProfilesLocked();

  if (profiles_.find(name) == profiles_.end()) {
    logger_.Warn("cannot switch to unknown camera profile", {{"profile", name}});
    return false;
  }
  if (name != current_profile_name_) {
    logger_.Info("camera profile switched manually",
                 {{"old_profile", current_profile_name_}, {"new_profile", name}});
    current_profile_name_ = name;
  }
  return true;
}

bool CameraProfileManager::UpdateCoordinates(const double latitude, const double longitude,
                                             std::string& error) {
  error.clear();
  const sun::GeoCoordinates requested{.latitude = latitude, .longitude = longitude};
  if (!sun::IsValidCoordinates(requested)) {
    error = "coordinates out of range (latitude must be in [-90, 90], longitude in [-180, 180])";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  coordinates_ = requested;
  if (!config::WriteCoordinates(store_, requested, error)) {
    logger_.Error("failed to persist coordinates", {{"error", error}});
    return false;
  }
  logger_.Info("coordinates updated", {{"latitude", core::FormatJsonNumber(latitude)},
                                       {"longitude", core::FormatJsonNumber(longitude)}});
  return true;
}

std::string CameraProfileManager::CurrentProfileName() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_profile_name_;
}

config::ProfileMap CameraProfileManager::Profiles() const {
  std::lock_guard<std::mutex> lock(mu_);
  return profiles_;
}

sun::GeoCoordinates CameraProfileManager::Coordinates() const {
  std::lock_guard<std::mutex> lock(mu_);
  return coordinates_;
}

std::optional<sun::SunPhaseResult> CameraProfileManager::LastPhase() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_phase_;
}

} // namespace cosmicam::camera
