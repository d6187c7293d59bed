#pragma once

#include "camera/capture_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cosmicam::camera::testing {

// One scripted capture outcome. A failing step writes nothing.
struct ScriptedCaptureStep {
  bool succeed = true;
  std::string error = "scripted capture failure";
  std::uint64_t file_size_bytes = 1024U;
};

// Capture backend that follows a fixed script instead of touching hardware.
// Once the script is exhausted every further call repeats the last step, or
// succeeds when the script is empty. Every request is recorded for
// assertions on the profile the loop handed over.
class ScriptedCaptureBackend final : public ICaptureBackend {
public:
  explicit ScriptedCaptureBackend(std::vector<ScriptedCaptureStep> script = {});

  bool Capture(const CaptureRequest& request, CaptureResult& result, std::string& error) override;

  std::string Name() const override {
    return "scripted";
  }

  std::size_t calls() const;
  std::size_t successes() const;
  const std::vector<CaptureRequest>& requests() const;

private:
  std::vector<ScriptedCaptureStep> script_;
  std::vector<CaptureRequest> requests_;
  std::size_t next_index_ = 0U;
  std::size_t successes_ = 0U;
};

// Writes `size_bytes` of filler to `path`, creating parent directories.
bool WriteFillerFile(const std::filesystem::path& path, std::uint64_t size_bytes,
                     std::string& error);

} // namespace cosmicam::camera::testing
