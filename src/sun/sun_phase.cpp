#include "sun/sun_phase.hpp"

#include "core/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cosmicam::sun {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSecondsPerDay = 86400.0;
constexpr double kUnixEpochJulianDate = 2440587.5;
constexpr double kJ2000JulianDate = 2451545.0;
constexpr double kDaysPerJulianCentury = 36525.0;

double Radians(double degrees) {
  return degrees * kPi / 180.0;
}

double Degrees(double radians) {
  return radians * 180.0 / kPi;
}

double NormalizeDegrees(double value, double period) {
  double normalized = std::fmod(value, period);
  if (normalized < 0.0) {
    normalized += period;
  }
  return normalized;
}

std::string FormatDegrees(double value) {
  std::ostringstream out;
  out.precision(4);
  out << std::fixed << value;
  return out.str();
}

} // namespace

const char* ToString(SunPhase phase) {
  switch (phase) {
  case SunPhase::kDay:
    return "day";
  case SunPhase::kCivilTwilight:
    return "civil_twilight";
  case SunPhase::kNauticalTwilight:
    return "nautical_twilight";
  case SunPhase::kAstronomicalTwilight:
    return "astronomical_twilight";
  case SunPhase::kNight:
    return "night";
  }
  return "day";
}

bool ParseSunPhase(std::string_view text, SunPhase& phase) {
  for (const SunPhase candidate : {SunPhase::kDay, SunPhase::kCivilTwilight,
                                   SunPhase::kNauticalTwilight, SunPhase::kAstronomicalTwilight,
                                   SunPhase::kNight}) {
    if (text == ToString(candidate)) {
      phase = candidate;
      return true;
    }
  }
  return false;
}

SunPhase PhaseForAltitude(const double altitude_degrees) {
  if (altitude_degrees <= kNightMaxAltitude) {
    return SunPhase::kNight;
  }
  if (altitude_degrees <= kAstronomicalTwilightMaxAltitude) {
    return SunPhase::kAstronomicalTwilight;
  }
  if (altitude_degrees <= kNauticalTwilightMaxAltitude) {
    return SunPhase::kNauticalTwilight;
  }
  if (altitude_degrees <= kCivilTwilightMaxAltitude) {
    return SunPhase::kCivilTwilight;
  }
  return SunPhase::kDay;
}

bool IsValidCoordinates(const GeoCoordinates& coordinates) {
  return std::isfinite(coordinates.latitude) && std::isfinite(coordinates.longitude) &&
         coordinates.latitude >= -90.0 && coordinates.latitude <= 90.0 &&
         coordinates.longitude >= -180.0 && coordinates.longitude <= 180.0;
}

bool ComputeSolarAltitude(const std::chrono::system_clock::time_point instant,
                          const GeoCoordinates& coordinates, double& altitude_degrees,
                          std::string& error) {
  error.clear();
  if (!IsValidCoordinates(coordinates)) {
    error = "coordinates out of range (latitude " + FormatDegrees(coordinates.latitude) +
            ", longitude " + FormatDegrees(coordinates.longitude) + ")";
    return false;
  }

  const double unix_seconds =
      std::chrono::duration<double>(instant.time_since_epoch()).count();
  const double julian_date = unix_seconds / kSecondsPerDay + kUnixEpochJulianDate;
  const double julian_century = (julian_date - kJ2000JulianDate) / kDaysPerJulianCentury;
  const double t = julian_century;

  // Column letters follow the NOAA solar calculation spreadsheet.
  const double geom_mean_long_sun =
      NormalizeDegrees(280.46646 + t * (36000.76983 + t * 0.0003032), 360.0); // I
  const double geom_mean_anom_sun = 357.52911 + t * (35999.05029 - 0.0001537 * t); // J
  const double eccent_earth_orbit = 0.016708634 - t * (0.000042037 + 0.0000001267 * t); // K
  const double sun_eq_of_ctr =
      std::sin(Radians(geom_mean_anom_sun)) * (1.914602 - t * (0.004817 + 0.000014 * t)) +
      std::sin(Radians(2.0 * geom_mean_anom_sun)) * (0.019993 - 0.000101 * t) +
      std::sin(Radians(3.0 * geom_mean_anom_sun)) * 0.000289; // L
  const double sun_true_long = geom_mean_long_sun + sun_eq_of_ctr; // M
  const double omega = 125.04 - 1934.136 * t;
  const double sun_app_long = sun_true_long - 0.00569 - 0.00478 * std::sin(Radians(omega)); // P
  const double mean_obliq_ecliptic =
      23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0; // Q
  const double obliq_corr = mean_obliq_ecliptic + 0.00256 * std::cos(Radians(omega)); // R
  const double sun_declin =
      Degrees(std::asin(std::sin(Radians(obliq_corr)) * std::sin(Radians(sun_app_long)))); // T
  const double var_y = std::tan(Radians(obliq_corr / 2.0)) * std::tan(Radians(obliq_corr / 2.0));
  const double l0 = Radians(geom_mean_long_sun);
  const double m = Radians(geom_mean_anom_sun);
  const double equation_of_time_minutes =
      4.0 * Degrees(var_y * std::sin(2.0 * l0) - 2.0 * eccent_earth_orbit * std::sin(m) +
                    4.0 * eccent_earth_orbit * var_y * std::sin(m) * std::cos(2.0 * l0) -
                    0.5 * var_y * var_y * std::sin(4.0 * l0) -
                    1.25 * eccent_earth_orbit * eccent_earth_orbit * std::sin(2.0 * m)); // V

  const double minutes_past_utc_midnight =
      NormalizeDegrees(unix_seconds, kSecondsPerDay) / 60.0;
  const double true_solar_time = NormalizeDegrees(
      minutes_past_utc_midnight + equation_of_time_minutes + 4.0 * coordinates.longitude,
      1440.0); // AB
  const double hour_angle = true_solar_time / 4.0 - 180.0; // AC

  const double lat = Radians(coordinates.latitude);
  const double decl = Radians(sun_declin);
  const double cos_zenith = std::clamp(std::sin(lat) * std::sin(decl) +
                                           std::cos(lat) * std::cos(decl) *
                                               std::cos(Radians(hour_angle)),
                                       -1.0, 1.0);
  const double zenith = Degrees(std::acos(cos_zenith)); // AD

  altitude_degrees = 90.0 - zenith;
  if (!std::isfinite(altitude_degrees)) {
    error = "solar altitude computation produced a non-finite value";
    return false;
  }
  return true;
}

SunPhaseResult ComputeSunPhase(const std::chrono::system_clock::time_point instant,
                               const GeoCoordinates& coordinates, core::logging::Logger& logger) {
  SunPhaseResult result;
  if (!ComputeSolarAltitude(instant, coordinates, result.altitude_degrees, result.error)) {
    result.phase = SunPhase::kDay;
    result.degraded = true;
    logger.Warn("sun phase computation failed, falling back to day",
                {{"latitude", FormatDegrees(coordinates.latitude)},
                 {"longitude", FormatDegrees(coordinates.longitude)},
                 {"error", result.error}});
    return result;
  }

  result.phase = PhaseForAltitude(result.altitude_degrees);
  logger.Debug("sun phase computed", {{"altitude_deg", FormatDegrees(result.altitude_degrees)},
                                      {"phase", ToString(result.phase)}});
  return result;
}

} // namespace cosmicam::sun
