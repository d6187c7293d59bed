#include "camera/artifact_naming.hpp"
#include "camera/testing/scripted_capture_backend.hpp"
#include "core/time_utils.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

using cosmicam::tests::common::AssertTrue;
using cosmicam::tests::common::Fail;

namespace {

void WriteFile(const fs::path& path, std::uint64_t size) {
  std::string error;
  if (!cosmicam::camera::testing::WriteFillerFile(path, size, error)) {
    Fail("failed to write fixture: " + error);
  }
  // Keep creation times strictly ordered even on coarse-timestamp filesystems.
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
}

} // namespace

int main() {
  const auto stamp = cosmicam::core::ParseCompactUtcStamp("20240320_051502");
  AssertTrue(stamp.has_value(), "stamp must parse");
  const std::string name = cosmicam::camera::BuildArtifactFileName(*stamp);
  if (name != "image_20240320_051502.jpg") {
    Fail("unexpected artifact name: " + name);
  }

  AssertTrue(cosmicam::camera::IsCaptureArtifactName(name), "built name must be recognized");
  AssertTrue(!cosmicam::camera::IsCaptureArtifactName("image_latest.jpg"),
             "non-timestamp suffix must be rejected");
  AssertTrue(!cosmicam::camera::IsCaptureArtifactName("image_20240320_051502.png"),
             "other extensions are not capture artifacts");
  AssertTrue(!cosmicam::camera::IsCaptureArtifactName("notes.jpg"), "prefix required");

  AssertTrue(cosmicam::camera::HasImageExtension("a/B.JPEG"), "extension check ignores case");
  AssertTrue(cosmicam::camera::HasImageExtension("shot.png"), "png counts as an image");
  AssertTrue(!cosmicam::camera::HasImageExtension("readme.txt"), "txt is not an image");

  cosmicam::tests::common::ScopedTempDir temp("cosmicam-artifact-naming-smoke");
  std::string error;

  std::optional<cosmicam::camera::ImageFileInfo> latest =
      cosmicam::camera::FindLatestImage(temp.path(), error);
  AssertTrue(!latest.has_value() && error.empty(), "empty directory has no latest image");

  WriteFile(temp.path() / "image_20240101_000000.jpg", 10);
  WriteFile(temp.path() / "manual_upload.PNG", 20);
  WriteFile(temp.path() / "notes.txt", 30);
  fs::create_directories(temp.path() / "nested.jpg");

  latest = cosmicam::camera::FindLatestImage(temp.path(), error);
  AssertTrue(latest.has_value(), "latest image expected");
  if (latest->path.filename() != "manual_upload.PNG") {
    Fail("newest image by creation time expected, got " + latest->path.string());
  }
  AssertTrue(latest->size_bytes == 20U, "latest image size");

  latest = cosmicam::camera::FindLatestImage(temp.path() / "missing", error);
  AssertTrue(!latest.has_value() && error.empty(), "missing directory holds no images");

  latest = cosmicam::camera::FindLatestImage(temp.path() / "notes.txt", error);
  AssertTrue(!latest.has_value() && !error.empty(), "unlistable path reports an error");

  return 0;
}
