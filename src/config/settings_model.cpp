#include "config/settings_model.hpp"

#include "core/json_utils.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace cosmicam::config {

namespace {

using JsonValue = core::json::Value;

CameraProfile MakeProfile(std::uint64_t shutter_speed, double gain, double brightness,
                          double contrast) {
  CameraProfile profile;
  profile.shutter_speed = shutter_speed;
  profile.gain = gain;
  profile.brightness = brightness;
  profile.contrast = contrast;
  return profile;
}

bool ReadFiniteNumber(const JsonValue& object, std::string_view key, std::optional<double>& value,
                      std::string& error) {
  value.reset();
  const JsonValue* field = object.Find(key);
  if (field == nullptr || field->type == JsonValue::Type::kNull) {
    return true;
  }
  if (!field->IsNumber() || !std::isfinite(field->number_value)) {
    error = "field '" + std::string(key) + "' must be a finite number";
    return false;
  }
  value = field->number_value;
  return true;
}

bool ReadNonNegativeInteger(const JsonValue& object, std::string_view key,
                            std::optional<std::uint64_t>& value, std::string& error) {
  std::optional<double> number;
  if (!ReadFiniteNumber(object, key, number, error)) {
    return false;
  }
  value.reset();
  if (!number.has_value()) {
    return true;
  }
  if (*number < 0.0 || std::floor(*number) != *number ||
      *number > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    error = "field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint64_t>(*number);
  return true;
}

std::string FormatNumber(double value) {
  return core::FormatJsonNumber(value);
}

} // namespace

bool operator==(const CameraProfile& lhs, const CameraProfile& rhs) {
  return lhs.shutter_speed == rhs.shutter_speed && lhs.gain == rhs.gain &&
         lhs.brightness == rhs.brightness && lhs.contrast == rhs.contrast;
}

bool operator!=(const CameraProfile& lhs, const CameraProfile& rhs) {
  return !(lhs == rhs);
}

bool CameraProfilePatch::empty() const {
  return !shutter_speed.has_value() && !gain.has_value() && !brightness.has_value() &&
         !contrast.has_value();
}

sun::GeoCoordinates DefaultCoordinates() {
  return sun::GeoCoordinates{kDefaultLatitude, kDefaultLongitude};
}

ProfileMap DefaultProfiles() {
  return {
      {std::string(kDefaultProfileName), MakeProfile(0U, 0.0, 0.0, 1.0)},
      {"day", MakeProfile(0U, 0.0, 0.0, 1.0)},
      {"civil_twilight", MakeProfile(100'000U, 1.5, 0.2, 1.1)},
      {"nautical_twilight", MakeProfile(1'000'000U, 1.8, 0.3, 1.2)},
      {"astronomical_twilight", MakeProfile(3'000'000U, 2.0, 0.4, 1.3)},
      {"night", MakeProfile(6'000'000U, 2.0, 0.5, 1.4)},
  };
}

SystemSettings DefaultSystemSettings() {
  return SystemSettings{};
}

void ApplyPatch(CameraProfile& profile, const CameraProfilePatch& patch) {
  if (patch.shutter_speed.has_value()) {
    profile.shutter_speed = *patch.shutter_speed;
  }
  if (patch.gain.has_value()) {
    profile.gain = *patch.gain;
  }
  if (patch.brightness.has_value()) {
    profile.brightness = patch.brightness;
  }
  if (patch.contrast.has_value()) {
    profile.contrast = *patch.contrast;
  }
}

bool ParseCoordinates(const JsonValue& document, sun::GeoCoordinates& coordinates,
                      std::string& error) {
  if (!document.IsObject()) {
    error = "coordinates document must be an object";
    return false;
  }

  std::optional<double> latitude;
  std::optional<double> longitude;
  if (!ReadFiniteNumber(document, "latitude", latitude, error) ||
      !ReadFiniteNumber(document, "longitude", longitude, error)) {
    return false;
  }
  if (!latitude.has_value() || !longitude.has_value()) {
    error = "coordinates document requires numeric 'latitude' and 'longitude'";
    return false;
  }

  coordinates.latitude = *latitude;
  coordinates.longitude = *longitude;
  return true;
}

bool ParseCameraProfile(const JsonValue& value, CameraProfile& profile, std::string& error) {
  if (!value.IsObject()) {
    error = "camera profile must be an object";
    return false;
  }

  std::optional<std::uint64_t> shutter_speed;
  std::optional<double> gain;
  std::optional<double> brightness;
  std::optional<double> contrast;
  if (!ReadNonNegativeInteger(value, "shutter_speed", shutter_speed, error) ||
      !ReadFiniteNumber(value, "gain", gain, error) ||
      !ReadFiniteNumber(value, "brightness", brightness, error) ||
      !ReadFiniteNumber(value, "contrast", contrast, error)) {
    return false;
  }
  if (gain.has_value() && *gain < 0.0) {
    error = "field 'gain' must be non-negative";
    return false;
  }
  if (contrast.has_value() && *contrast < 0.0) {
    error = "field 'contrast' must be non-negative";
    return false;
  }

  CameraProfile parsed;
  parsed.shutter_speed = shutter_speed.value_or(0U);
  parsed.gain = gain.value_or(0.0);
  parsed.brightness = brightness;
  parsed.contrast = contrast.value_or(1.0);
  profile = parsed;
  return true;
}

bool ParseProfileMap(const JsonValue& document, ProfileMap& profiles, std::string& error) {
  if (!document.IsObject()) {
    error = "camera_profiles document must be an object";
    return false;
  }

  ProfileMap parsed;
  for (const auto& [name, value] : document.object_value) {
    CameraProfile profile;
    if (!ParseCameraProfile(value, profile, error)) {
      error = "profile '" + name + "': " + error;
      return false;
    }
    parsed.emplace(name, profile);
  }

  // Lookups of the active profile fall back to `default`, so it must exist.
  const std::string default_name(kDefaultProfileName);
  if (parsed.find(default_name) == parsed.end()) {
    parsed.emplace(default_name, DefaultProfiles().at(default_name));
  }

  profiles = std::move(parsed);
  return true;
}

bool ParseSystemSettings(const JsonValue& document, SystemSettings& settings,
                         std::string& error) {
  if (!document.IsObject()) {
    error = "system_settings document must be an object";
    return false;
  }

  SystemSettings parsed = DefaultSystemSettings();

  std::optional<double> interval;
  if (!ReadFiniteNumber(document, "capture_interval_seconds", interval, error)) {
    return false;
  }
  if (!interval.has_value() &&
      !ReadFiniteNumber(document, "capture_interval", interval, error)) {
    return false;
  }
  if (interval.has_value()) {
    if (*interval > static_cast<double>(kMaxCaptureIntervalSeconds)) {
      error = "capture interval must be at most " + std::to_string(kMaxCaptureIntervalSeconds) +
              " seconds";
      return false;
    }
    const double whole_seconds = std::floor(*interval);
    parsed.capture_interval =
        std::chrono::seconds(whole_seconds < 1.0 ? 1 : static_cast<std::int64_t>(whole_seconds));
  }

  std::optional<double> max_bytes;
  if (!ReadFiniteNumber(document, "max_disk_usage_bytes", max_bytes, error)) {
    return false;
  }
  if (!max_bytes.has_value()) {
    std::optional<double> max_gb;
    if (!ReadFiniteNumber(document, "max_disk_usage_gb", max_gb, error)) {
      return false;
    }
    if (max_gb.has_value()) {
      max_bytes = *max_gb * kBytesPerGibibyte;
    }
  }
  if (max_bytes.has_value()) {
    if (*max_bytes <= 0.0) {
      error = "disk usage limit must be positive";
      return false;
    }
    parsed.max_disk_usage_bytes = *max_bytes;
  }

  settings = parsed;
  return true;
}

JsonValue ToJson(const sun::GeoCoordinates& coordinates) {
  JsonValue document = JsonValue::MakeObject();
  document.object_value["latitude"] = JsonValue::MakeNumber(coordinates.latitude);
  document.object_value["longitude"] = JsonValue::MakeNumber(coordinates.longitude);
  return document;
}

JsonValue ToJson(const CameraProfile& profile) {
  JsonValue value = JsonValue::MakeObject();
  value.object_value["shutter_speed"] =
      JsonValue::MakeNumber(static_cast<double>(profile.shutter_speed));
  value.object_value["gain"] = JsonValue::MakeNumber(profile.gain);
  value.object_value["brightness"] =
      profile.brightness.has_value() ? JsonValue::MakeNumber(*profile.brightness) : JsonValue{};
  value.object_value["contrast"] = JsonValue::MakeNumber(profile.contrast);
  return value;
}

JsonValue ToJson(const ProfileMap& profiles) {
  JsonValue document = JsonValue::MakeObject();
  for (const auto& [name, profile] : profiles) {
    document.object_value[name] = ToJson(profile);
  }
  return document;
}

JsonValue ToJson(const SystemSettings& settings) {
  JsonValue document = JsonValue::MakeObject();
  document.object_value["capture_interval_seconds"] =
      JsonValue::MakeNumber(static_cast<double>(settings.capture_interval.count()));
  document.object_value["max_disk_usage_bytes"] =
      JsonValue::MakeNumber(settings.max_disk_usage_bytes);
  return document;
}

std::string Describe(const CameraProfile& profile) {
  std::ostringstream out;
  out << "shutter_speed=" << profile.shutter_speed << " gain=" << FormatNumber(profile.gain)
      << " brightness="
      << (profile.brightness.has_value() ? FormatNumber(*profile.brightness) : "unset")
      << " contrast=" << FormatNumber(profile.contrast);
  return out.str();
}

std::map<std::string, std::string> DescribeFields(const CameraProfile& profile) {
  std::map<std::string, std::string> fields;
  fields["shutter_speed"] = std::to_string(profile.shutter_speed);
  fields["gain"] = FormatNumber(profile.gain);
  if (profile.brightness.has_value()) {
    fields["brightness"] = FormatNumber(*profile.brightness);
  }
  fields["contrast"] = FormatNumber(profile.contrast);
  return fields;
}

} // namespace cosmicam::config
