#ifndef COSMICAM_CORE_TIME_UTILS_HPP_
#define COSMICAM_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace cosmicam::core {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

// Canonical UTC timestamp used by log lines, events and query results.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Second-resolution compact stamp (`20240320_120000`) used in artifact names.
inline std::string FormatCompactUtcStamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y%m%d_%H%M%S");
  return out.str();
}

// Inverse of FormatCompactUtcStamp. Returns nullopt for anything that is not
// exactly `YYYYMMDD_HHMMSS`.
inline std::optional<std::chrono::system_clock::time_point>
ParseCompactUtcStamp(const std::string& text) {
  if (text.size() != 15U || text[8] != '_') {
    return std::nullopt;
  }

  std::tm utc_time{};
  std::istringstream in(text);
  in >> std::get_time(&utc_time, "%Y%m%d_%H%M%S");
  if (in.fail()) {
    return std::nullopt;
  }

#if defined(_WIN32)
  const std::time_t epoch_seconds = _mkgmtime(&utc_time);
#else
  const std::time_t epoch_seconds = timegm(&utc_time);
#endif
  if (epoch_seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(epoch_seconds);
}

} // namespace cosmicam::core

#endif // COSMICAM_CORE_TIME_UTILS_HPP_
