#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace cosmicam::cli {

// Process-level options shared by every subcommand. Defaults are relative to
// $COSMICAM_ROOT when it is set, otherwise to the working directory.
struct ServiceOptions {
  std::filesystem::path config_dir = "config";
  std::filesystem::path image_dir = "images";
  // Unset disables the JSONL event timeline.
  std::optional<std::filesystem::path> events_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  // Empty logs to stderr.
  std::filesystem::path log_file;
  std::string capture_command = "libcamera-still";
  std::optional<std::chrono::seconds> capture_timeout;
  std::chrono::milliseconds retry_delay{5000};
};

ServiceOptions DefaultServiceOptions();

// Routes `cosmicam` subcommands and returns process exit codes with a stable
// contract for service managers and scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => settings store could not be opened or written
//   20 => one-shot capture failed
//   30 => no image artifacts to report
int Dispatch(int argc, char** argv);

} // namespace cosmicam::cli
