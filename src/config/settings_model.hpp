#pragma once

#include "core/json_dom.hpp"
#include "sun/sun_phase.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cosmicam::config {

constexpr std::string_view kDefaultProfileName = "default";

constexpr double kDefaultLatitude = 32.7;
constexpr double kDefaultLongitude = -97.3;
constexpr std::int64_t kDefaultCaptureIntervalSeconds = 60;
// One year. Keeps the interval well inside the millisecond range the loop
// sleeps with.
constexpr std::int64_t kMaxCaptureIntervalSeconds = 365LL * 24 * 60 * 60;
constexpr double kDefaultMaxDiskUsageBytes = 20.0 * 1024.0 * 1024.0 * 1024.0;
constexpr double kBytesPerGibibyte = 1024.0 * 1024.0 * 1024.0;

// Capture parameters handed to the imaging command.
//
// - shutter_speed: exposure in microseconds, 0 lets the sensor choose
// - gain: analogue gain, 0 lets the sensor choose
// - brightness: unset means "do not pass"; 0 is a real setting
// - contrast: values <= 0 are not passed
struct CameraProfile {
  std::uint64_t shutter_speed = 0;
  double gain = 0.0;
  std::optional<double> brightness = 0.0;
  double contrast = 1.0;
};

bool operator==(const CameraProfile& lhs, const CameraProfile& rhs);
bool operator!=(const CameraProfile& lhs, const CameraProfile& rhs);

// Partial profile edit. Only engaged fields are merged.
struct CameraProfilePatch {
  std::optional<std::uint64_t> shutter_speed;
  std::optional<double> gain;
  std::optional<double> brightness;
  std::optional<double> contrast;

  bool empty() const;
};

using ProfileMap = std::map<std::string, CameraProfile>;

struct SystemSettings {
  std::chrono::seconds capture_interval{kDefaultCaptureIntervalSeconds};
  double max_disk_usage_bytes = kDefaultMaxDiskUsageBytes;
};

sun::GeoCoordinates DefaultCoordinates();
ProfileMap DefaultProfiles();
SystemSettings DefaultSystemSettings();

void ApplyPatch(CameraProfile& profile, const CameraProfilePatch& patch);

// Parsers validate types and ranges and report the first offending field.
bool ParseCoordinates(const core::json::Value& document, sun::GeoCoordinates& coordinates,
                      std::string& error);
bool ParseCameraProfile(const core::json::Value& value, CameraProfile& profile,
                        std::string& error);
bool ParseProfileMap(const core::json::Value& document, ProfileMap& profiles, std::string& error);

// Accepts `capture_interval_seconds` / `max_disk_usage_bytes`, falling back to
// the older `capture_interval` / `max_disk_usage_gb` keys. Missing keys take
// defaults; an interval below one second is raised to one, an interval above
// kMaxCaptureIntervalSeconds is rejected.
bool ParseSystemSettings(const core::json::Value& document, SystemSettings& settings,
                         std::string& error);

core::json::Value ToJson(const sun::GeoCoordinates& coordinates);
core::json::Value ToJson(const CameraProfile& profile);
core::json::Value ToJson(const ProfileMap& profiles);
core::json::Value ToJson(const SystemSettings& settings);

// Flat key=value rendering for log fields and CLI output.
std::string Describe(const CameraProfile& profile);

// Same values keyed by field name; unset brightness is omitted.
std::map<std::string, std::string> DescribeFields(const CameraProfile& profile);

} // namespace cosmicam::config
