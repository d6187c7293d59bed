#pragma once

#include "camera/capture_backend.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::camera {

struct LibcameraStillOptions {
  std::string executable = "libcamera-still";
  std::uint32_t width = 4056;
  std::uint32_t height = 3040;
  // Unset means wait for the tool however long it takes.
  std::optional<std::chrono::seconds> timeout;
};

// Builds the argv for one still capture. Parameters are only passed when they
// carry a real request: shutter/gain 0 mean "auto", contrast <= 0 is
// meaningless, and brightness is passed whenever it is set, including 0.
std::vector<std::string> BuildLibcameraStillCommand(const LibcameraStillOptions& options,
                                                    const CaptureRequest& request);

// Runs the imaging command as a child process (fork/execvp), collecting its
// output through a pipe. Succeeds only when the tool exits 0 and the output
// file exists.
class LibcameraStillBackend final : public ICaptureBackend {
public:
  LibcameraStillBackend(LibcameraStillOptions options, core::logging::Logger& logger);

  bool Capture(const CaptureRequest& request, CaptureResult& result, std::string& error) override;

  std::string Name() const override {
    return options_.executable;
  }

private:
  LibcameraStillOptions options_;
  core::logging::Logger& logger_;
};

} // namespace cosmicam::camera
