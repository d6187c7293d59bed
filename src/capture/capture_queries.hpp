#pragma once

#include "config/settings_model.hpp"
#include "sun/sun_phase.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::camera {
class CameraProfileManager;
}

namespace cosmicam::capture {

struct LatestArtifact {
  std::filesystem::path path;
  std::chrono::system_clock::time_point timestamp{};
  std::uint64_t size_bytes = 0;
  sun::SunPhaseResult phase;
  std::string profile_name;
  config::CameraProfile profile_settings;
};

struct CurrentProfileView {
  std::string profile_name;
  config::CameraProfile settings;
  sun::SunPhaseResult phase;
  sun::GeoCoordinates coordinates;
};

// Read-mostly operations for out-of-band callers (CLI, a future API layer).
// Each one refreshes the profile manager first, so answers reflect the
// current sun phase and the latest stored settings.
class CaptureQueries {
public:
  CaptureQueries(std::filesystem::path image_dir, camera::CameraProfileManager& profiles,
                 core::logging::Logger& logger);

  // Fails with "no images found" when the directory holds no image.
  bool GetLatestArtifact(LatestArtifact& latest, std::string& error);

  CurrentProfileView GetCurrentProfile();

  // Persists the coordinates, then refreshes so the profile follows them.
  bool UpdateCoordinates(double latitude, double longitude, std::string& error);

private:
  std::filesystem::path image_dir_;
  camera::CameraProfileManager& profiles_;
  core::logging::Logger& logger_;
};

} // namespace cosmicam::capture
