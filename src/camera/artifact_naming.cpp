#include "camera/artifact_naming.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace cosmicam::camera {

namespace {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

std::string BuildArtifactFileName(std::chrono::system_clock::time_point capture_time) {
  return std::string(kArtifactPrefix) + core::FormatCompactUtcStamp(capture_time) +
         std::string(kArtifactExtension);
}

bool IsCaptureArtifactName(std::string_view file_name) {
  if (file_name.size() <= kArtifactPrefix.size() + kArtifactExtension.size()) {
    return false;
  }
  if (file_name.substr(0, kArtifactPrefix.size()) != kArtifactPrefix) {
    return false;
  }
  if (file_name.substr(file_name.size() - kArtifactExtension.size()) != kArtifactExtension) {
    return false;
  }

  const std::size_t stamp_size =
      file_name.size() - kArtifactPrefix.size() - kArtifactExtension.size();
  const std::string stamp(file_name.substr(kArtifactPrefix.size(), stamp_size));
  return core::ParseCompactUtcStamp(stamp).has_value();
}

bool HasImageExtension(const fs::path& path) {
  const std::string extension = ToLowerAscii(path.extension().string());
  return extension == ".jpg" || extension == ".jpeg" || extension == ".png";
}

bool ReadCreationTime(const fs::path& path, std::chrono::system_clock::time_point& created_at,
                      std::string& error) {
#if defined(__linux__) || defined(__APPLE__)
  struct stat info {};
  if (::lstat(path.c_str(), &info) != 0) {
    error = "stat failed for '" + path.string() + "': " + std::strerror(errno);
    return false;
  }
#if defined(__APPLE__)
  const auto seconds = std::chrono::seconds(info.st_ctimespec.tv_sec);
  const auto nanos = std::chrono::nanoseconds(info.st_ctimespec.tv_nsec);
#else
  const auto seconds = std::chrono::seconds(info.st_ctim.tv_sec);
  const auto nanos = std::chrono::nanoseconds(info.st_ctim.tv_nsec);
#endif
  created_at = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(seconds + nanos));
  return true;
#else
  std::error_code ec;
  const auto write_time = fs::last_write_time(path, ec);
  if (ec) {
    error = "failed to read timestamp of '" + path.string() + "': " + ec.message();
    return false;
  }
  created_at = std::chrono::clock_cast<std::chrono::system_clock>(write_time);
  return true;
#endif
}

std::optional<ImageFileInfo> FindLatestImage(const fs::path& dir, std::string& error) {
  error.clear();
  std::error_code ec;
  if (!fs::exists(dir, ec) && !ec) {
    // Nothing captured yet.
    return std::nullopt;
  }
  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "failed to list image directory '" + dir.string() + "': " + ec.message();
    return std::nullopt;
  }

  std::optional<ImageFileInfo> latest;
  const bool listed = core::ForEachDirectoryEntry(
      std::move(it), dir,
      [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec || !HasImageExtension(entry.path())) {
          return;
        }

        ImageFileInfo candidate;
        candidate.path = entry.path();
        std::string stat_error;
        if (!ReadCreationTime(candidate.path, candidate.created_at, stat_error)) {
          // Removed between listing and stat; the next one is as good.
          return;
        }
        candidate.size_bytes = static_cast<std::uint64_t>(entry.file_size(entry_ec));
        if (entry_ec) {
          return;
        }

        if (!latest.has_value() || candidate.created_at > latest->created_at ||
            (candidate.created_at == latest->created_at &&
             candidate.path.filename() > latest->path.filename())) {
          latest = std::move(candidate);
        }
      },
      error);
  if (!listed) {
    return std::nullopt;
  }
  return latest;
}

} // namespace cosmicam::camera
