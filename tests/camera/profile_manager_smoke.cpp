#include "camera/profile_manager.hpp"
#include "config/settings_model.hpp"
#include "config/settings_store.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"

#include "common/assertions.hpp"
#include "common/recording_sink.hpp"

#include <chrono>
#include <sstream>
#include <string>

using cosmicam::events::EventType;
using cosmicam::sun::SunPhase;
using cosmicam::tests::common::AssertContains;
using cosmicam::tests::common::AssertTrue;
using cosmicam::tests::common::Fail;

namespace {

std::chrono::system_clock::time_point Utc(const std::string& stamp) {
  const auto parsed = cosmicam::core::ParseCompactUtcStamp(stamp);
  if (!parsed.has_value()) {
    Fail("bad stamp: " + stamp);
  }
  return *parsed;
}

void SetCoordinates(cosmicam::config::InMemorySettingsStore& store, double latitude,
                    double longitude) {
  std::string error;
  if (!cosmicam::config::WriteCoordinates(store, {.latitude = latitude, .longitude = longitude},
                                          error)) {
    Fail("failed to seed coordinates: " + error);
  }
}

} // namespace

int main() {
  std::ostringstream log_text;
  cosmicam::core::logging::Logger logger(cosmicam::core::logging::LogLevel::kDebug, log_text);
  cosmicam::config::InMemorySettingsStore store;
  cosmicam::tests::common::RecordingEventSink sink;
  cosmicam::events::Emitter emitter(&sink);

  SetCoordinates(store, 0.0, 0.0);
  auto now = Utc("20240320_120000");
  cosmicam::camera::CameraProfileManager manager(store, logger, &emitter, [&now] { return now; });
  AssertTrue(manager.CurrentProfileName() == "default", "initial profile is default");
  AssertTrue(!manager.LastPhase().has_value(), "no phase before the first refresh");

  // Noon on the equator: day, one transition.
  cosmicam::sun::SunPhaseResult phase = manager.RefreshFromSunPhase();
  AssertTrue(phase.phase == SunPhase::kDay, "noon must be day");
  AssertTrue(manager.CurrentProfileName() == "day", "day profile active");
  AssertTrue(sink.Count(EventType::kProfileChanged) == 1U, "one profile_changed event");

  // Refreshing with the same phase changes nothing.
  (void)manager.RefreshFromSunPhase();
  (void)manager.RefreshFromSunPhase();
  AssertTrue(sink.Count(EventType::kProfileChanged) == 1U, "refresh must be idempotent");

  // Civil twilight after sunset.
  now = Utc("20240320_181500");
  phase = manager.RefreshFromSunPhase();
  AssertTrue(phase.phase == SunPhase::kCivilTwilight, "18:15 UTC is civil twilight");
  AssertTrue(manager.CurrentSettings().shutter_speed == 100'000U, "civil twilight settings");
  const cosmicam::events::Event& changed = sink.events().back();
  AssertTrue(changed.payload.at("old_profile") == "day", "old profile recorded");
  AssertTrue(changed.payload.at("new_profile") == "civil_twilight", "new profile recorded");
  AssertTrue(changed.payload.at("setting.gain") == "1.5", "new settings recorded");

  // Phase without a profile keeps the active one and reports it once.
  cosmicam::config::ProfileMap trimmed = cosmicam::config::DefaultProfiles();
  trimmed.erase("nautical_twilight");
  store.Replace(cosmicam::config::kCameraProfilesDocument, cosmicam::config::ToJson(trimmed));
  now = Utc("20240320_184500");
  phase = manager.RefreshFromSunPhase();
  AssertTrue(phase.phase == SunPhase::kNauticalTwilight, "18:45 UTC is nautical twilight");
  AssertTrue(manager.CurrentProfileName() == "civil_twilight", "unmatched phase keeps profile");
  (void)manager.RefreshFromSunPhase();
  AssertTrue(sink.Count(EventType::kProfileUnmatched) == 1U, "one profile_unmatched event");
  AssertTrue(sink.Count(EventType::kProfileChanged) == 2U, "no change event when unmatched");
  store.Replace(cosmicam::config::kCameraProfilesDocument,
                cosmicam::config::ToJson(cosmicam::config::DefaultProfiles()));

  // Manual switching.
  AssertTrue(!manager.SwitchProfile("missing"), "unknown profile must be refused");
  AssertTrue(manager.CurrentProfileName() == "civil_twilight", "refused switch changes nothing");
  AssertTrue(manager.SwitchProfile("night"), "known profile switch");
  AssertTrue(manager.CurrentSettings().shutter_speed == 6'000'000U, "night settings active");

  // New coordinates are visible on the next refresh.
  std::string error;
  now = Utc("20240320_120000");
  if (!manager.UpdateCoordinates(0.0, 180.0, error)) {
    Fail("coordinate update failed: " + error);
  }
  phase = manager.RefreshFromSunPhase();
  AssertTrue(phase.phase == SunPhase::kNight, "antimeridian at noon UTC is night");
  AssertTrue(manager.Coordinates().longitude == 180.0, "coordinates persisted and reloaded");
  AssertTrue(!manager.UpdateCoordinates(95.0, 0.0, error), "latitude above 90 rejected");
  AssertTrue(manager.Coordinates().latitude == 0.0, "rejected update changes nothing");
  AssertTrue(!manager.UpdateCoordinates(0.0, -180.5, error), "longitude below -180 rejected");
  AssertContains(error, "out of range");

  // Profile edits: new names start from the default entry.
  cosmicam::config::CameraProfilePatch patch;
  patch.gain = 3.0;
  if (!manager.UpdateProfile("aurora", patch, error)) {
    Fail("profile creation failed: " + error);
  }
  cosmicam::config::ProfileMap stored;
  if (!cosmicam::config::ReadProfiles(store, stored, error)) {
    Fail("reading profiles failed: " + error);
  }
  AssertTrue(stored.count("aurora") == 1U, "new profile persisted");
  AssertTrue(stored.at("aurora").gain == 3.0, "patched field persisted");
  AssertTrue(stored.at("aurora").contrast == 1.0, "unpatched field taken from default");

  // The active profile disappearing falls back to default.
  AssertTrue(manager.SwitchProfile("aurora"), "switch to new profile");
  store.Replace(cosmicam::config::kCameraProfilesDocument,
                cosmicam::config::ToJson(cosmicam::config::DefaultProfiles()));
  AssertTrue(manager.CurrentSettings() == cosmicam::config::DefaultProfiles().at("default"),
             "vanished profile falls back to default");

  // Write failure: reported, merge kept in memory.
  store.SetFailWrites(true);
  patch.gain = 9.0;
  AssertTrue(!manager.UpdateProfile("night", patch, error), "write failure reported");
  AssertContains(error, "simulated");
  AssertTrue(manager.Profiles().at("night").gain == 9.0, "in-memory merge kept");
  store.SetFailWrites(false);

  // Unreadable store at construction: built-in defaults, warning logged.
  store.SetFailReads(true);
  cosmicam::camera::CameraProfileManager degraded(store, logger, nullptr, [&now] { return now; });
  AssertTrue(degraded.Coordinates().latitude == cosmicam::config::kDefaultLatitude,
             "default coordinates on read failure");
  AssertTrue(degraded.Profiles() == cosmicam::config::DefaultProfiles(),
             "default profiles on read failure");
  AssertContains(log_text.str(), "level=WARN");
  store.SetFailReads(false);

  // Emission failures never break a refresh.
  sink.SetFail(true);
  now = Utc("20240320_000000");
  SetCoordinates(store, 0.0, 0.0);
  phase = manager.RefreshFromSunPhase();
  AssertTrue(phase.phase == SunPhase::kNight, "refresh still works when events fail");
  AssertContains(log_text.str(), "failed to record profile change event");

  return 0;
}
