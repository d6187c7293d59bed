#pragma once

#include <filesystem>
#include <string>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::camera {

// Post-capture hook run on every successful artifact before quota
// enforcement. `output` is the path the rest of the cycle reports, which may
// equal `input` when the processor works in place.
class IImageProcessor {
public:
  virtual ~IImageProcessor() = default;

  virtual bool Process(const std::filesystem::path& input, std::filesystem::path& output,
                       std::string& error) = 0;
};

// Hands the capture back untouched.
class PassThroughProcessor final : public IImageProcessor {
public:
  explicit PassThroughProcessor(core::logging::Logger& logger);

  bool Process(const std::filesystem::path& input, std::filesystem::path& output,
               std::string& error) override;

private:
  core::logging::Logger& logger_;
};

} // namespace cosmicam::camera
