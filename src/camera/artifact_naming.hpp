#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cosmicam::camera {

// Capture artifacts are `image_YYYYMMDD_HHMMSS.jpg`, stamped in UTC. The name
// is unique per second, and the capture loop never runs faster than once a
// second.
constexpr std::string_view kArtifactPrefix = "image_";
constexpr std::string_view kArtifactExtension = ".jpg";

std::string BuildArtifactFileName(std::chrono::system_clock::time_point capture_time);

// True only for names produced by BuildArtifactFileName. Quota eviction is
// restricted to these so operator files in the directory are never removed.
bool IsCaptureArtifactName(std::string_view file_name);

// Case-insensitive `.jpg`, `.jpeg`, `.png`: what external readers treat as an
// image when looking for the newest one.
bool HasImageExtension(const std::filesystem::path& path);

// File creation time as the eviction and "latest" order key. On POSIX this is
// the inode status-change time, which for write-once artifacts is the moment
// the file was published.
bool ReadCreationTime(const std::filesystem::path& path,
                      std::chrono::system_clock::time_point& created_at, std::string& error);

struct ImageFileInfo {
  std::filesystem::path path;
  std::chrono::system_clock::time_point created_at{};
  std::uint64_t size_bytes = 0;
};

// Newest image (by creation time, then name) directly inside `dir`. Returns
// nullopt with an empty `error` when the directory is missing or holds no
// images, and with `error` set when it exists but cannot be listed.
std::optional<ImageFileInfo> FindLatestImage(const std::filesystem::path& dir, std::string& error);

} // namespace cosmicam::camera
