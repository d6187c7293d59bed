#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::sun {

// Solar altitude buckets, brightest to darkest. The string forms double as
// camera profile names in the `camera_profiles` settings document.
enum class SunPhase {
  kDay,
  kCivilTwilight,
  kNauticalTwilight,
  kAstronomicalTwilight,
  kNight,
};

struct GeoCoordinates {
  double latitude = 0.0;
  double longitude = 0.0;
};

// Altitude thresholds in degrees. A value exactly on a threshold belongs to
// the darker bucket.
constexpr double kNightMaxAltitude = -18.0;
constexpr double kAstronomicalTwilightMaxAltitude = -12.0;
constexpr double kNauticalTwilightMaxAltitude = -6.0;
constexpr double kCivilTwilightMaxAltitude = -0.833;

const char* ToString(SunPhase phase);
bool ParseSunPhase(std::string_view text, SunPhase& phase);

SunPhase PhaseForAltitude(double altitude_degrees);

bool IsValidCoordinates(const GeoCoordinates& coordinates);

// NOAA solar position: altitude of the sun centre above the geometric
// horizon, without atmospheric refraction. Fails only for non-finite or
// out-of-range coordinates.
bool ComputeSolarAltitude(std::chrono::system_clock::time_point instant,
                          const GeoCoordinates& coordinates, double& altitude_degrees,
                          std::string& error);

struct SunPhaseResult {
  SunPhase phase = SunPhase::kDay;
  double altitude_degrees = 0.0;
  // True when the altitude could not be computed and `phase` is the
  // daylight fallback.
  bool degraded = false;
  std::string error;
};

// Never fails: a computation error yields kDay with `degraded` set, logged as
// a warning, so the capture loop always has a phase to work with.
SunPhaseResult ComputeSunPhase(std::chrono::system_clock::time_point instant,
                               const GeoCoordinates& coordinates, core::logging::Logger& logger);

} // namespace cosmicam::sun
