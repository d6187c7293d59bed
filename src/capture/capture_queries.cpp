#include "capture/capture_queries.hpp"

#include "camera/artifact_naming.hpp"
#include "camera/profile_manager.hpp"
#include "core/logging/logger.hpp"

#include <optional>
#include <utility>

namespace cosmicam::capture {

CaptureQueries::CaptureQueries(std::filesystem::path image_dir,
                               camera::CameraProfileManager& profiles,
                               core::logging::Logger& logger)
    : image_dir_(std::move(image_dir)), profiles_(profiles), logger_(logger) {}

bool CaptureQueries::GetLatestArtifact(LatestArtifact& latest, std::string& error) {
  error.clear();
  const std::optional<camera::ImageFileInfo> found = camera::FindLatestImage(image_dir_, error);
  if (!found.has_value()) {
    if (error.empty()) {
      error = "no images found";
    }
    logger_.Warn("latest image lookup failed",
                 {{"image_dir", image_dir_.string()}, {"error", error}});
    return false;
  }

  latest = LatestArtifact{};
  latest.path = found->path;
  latest.timestamp = found->created_at;
  latest.size_bytes = found->size_bytes;
  latest.phase = profiles_.RefreshFromSunPhase();
  latest.profile_name = profiles_.CurrentProfileName();
  latest.profile_settings = profiles_.CurrentSettings();
  return true;
}

CurrentProfileView CaptureQueries::GetCurrentProfile() {
  CurrentProfileView view;
  view.phase = profiles_.RefreshFromSunPhase();
  view.profile_name = profiles_.CurrentProfileName();
  view.settings = profiles_.CurrentSettings();
  view.coordinates = profiles_.Coordinates();
  return view;
}

bool CaptureQueries::UpdateCoordinates(const double latitude, const double longitude,
                                       std::string& error) {
  if (!profiles_.UpdateCoordinates(latitude, longitude, error)) {
    return false;
  }
  (void)profiles_.RefreshFromSunPhase();
  return true;
}

} // namespace cosmicam::capture
