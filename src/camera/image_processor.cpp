#include "camera/image_processor.hpp"

#include "core/logging/logger.hpp"

namespace cosmicam::camera {

PassThroughProcessor::PassThroughProcessor(core::logging::Logger& logger) : logger_(logger) {}

bool PassThroughProcessor::Process(const std::filesystem::path& input,
                                   std::filesystem::path& output, std::string& error) {
  error.clear();
  if (input.empty()) {
    error = "image processor received an empty path";
    return false;
  }
  output = input;
  logger_.Debug("image processing skipped", {{"path", input.string()}});
  return true;
}

} // namespace cosmicam::camera
