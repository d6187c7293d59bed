#pragma once

#include "config/settings_model.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace cosmicam::camera {

struct CaptureRequest {
  std::filesystem::path output_path;
  config::CameraProfile profile;
};

struct CaptureResult {
  std::filesystem::path artifact_path;
  std::chrono::milliseconds duration{0};
  // Combined stdout/stderr of the imaging tool, truncated, for diagnostics.
  std::string tool_output;
};

// Still-image acquisition contract used by the capture loop.
//
// - `Capture` blocks for the whole exposure, which may be several seconds
//   for night profiles.
// - On success exactly one new file exists at `result.artifact_path`.
// - On failure `error` says why and no partial artifact is left behind when
//   the implementation can avoid it.
class ICaptureBackend {
public:
  virtual ~ICaptureBackend() = default;

  virtual bool Capture(const CaptureRequest& request, CaptureResult& result,
                       std::string& error) = 0;

  // Short identifier for logs (`libcamera-still`, `scripted`).
  virtual std::string Name() const = 0;
};

} // namespace cosmicam::camera
