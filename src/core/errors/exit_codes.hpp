#pragma once

namespace cosmicam::core::errors {

// Process-exit contract for the cosmicam CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let service wrappers tell apart the failure classes
// that need different operator action.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kCaptureFailed = 20,
  kNoArtifacts = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace cosmicam::core::errors
