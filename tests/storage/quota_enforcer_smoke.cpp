#include "camera/artifact_naming.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "storage/quota_enforcer.hpp"

#include "common/assertions.hpp"
#include "common/recording_sink.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using cosmicam::tests::common::AssertContains;
using cosmicam::tests::common::AssertTrue;
using cosmicam::tests::common::Fail;

namespace {

constexpr std::uint64_t kMiB = 1024U * 1024U;

// Sparse files keep the fixture fast while reporting the intended size.
void MakeFile(const fs::path& path, std::uint64_t size) {
  fs::create_directories(path.parent_path());
  { std::ofstream out(path, std::ios::binary | std::ios::trunc); }
  fs::resize_file(path, size);
  std::this_thread::sleep_for(std::chrono::milliseconds(15));
}

std::string ArtifactName(int index) {
  const auto ts =
      std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000 + index));
  return cosmicam::camera::BuildArtifactFileName(ts);
}

} // namespace

int main() {
  std::ostringstream log_text;
  cosmicam::core::logging::Logger logger(cosmicam::core::logging::LogLevel::kDebug, log_text);
  cosmicam::tests::common::RecordingEventSink sink;
  cosmicam::events::Emitter emitter(&sink);

  // Under quota: nothing happens.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-under");
    MakeFile(temp.path() / ArtifactName(0), 50U * kMiB);
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 100.0 * kMiB, logger, &emitter);
    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(!report.cleanup_performed, "no cleanup under quota");
    AssertTrue(report.usage_before_bytes == 50U * kMiB, "usage measured");
    AssertTrue(report.files_deleted == 0U, "nothing deleted");
    AssertTrue(fs::exists(temp.path() / ArtifactName(0)), "artifact kept");
    AssertTrue(sink.events().empty(), "no event for a no-op pass");
  }

  // 120 MiB over a 100 MiB quota: oldest artifacts go until 90 MiB remain.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-over");
    for (int i = 0; i < 12; ++i) {
      MakeFile(temp.path() / ArtifactName(i), 10U * kMiB);
    }
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 100.0 * kMiB, logger, &emitter);

    std::vector<cosmicam::camera::ImageFileInfo> candidates;
    std::string error;
    if (!enforcer.ListCandidatesOldestFirst(candidates, error)) {
      Fail("listing candidates failed: " + error);
    }
    AssertTrue(candidates.size() == 12U, "all artifacts are candidates");
    AssertTrue(candidates.front().path.filename() == ArtifactName(0), "oldest first");

    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(report.cleanup_performed, "cleanup over quota");
    AssertTrue(report.usage_before_bytes == 120U * kMiB, "usage before");
    AssertTrue(report.bytes_to_free == 30U * kMiB, "excess over the 90% watermark");
    AssertTrue(report.bytes_reclaimed >= 30U * kMiB, "reclaimed at least the excess");
    AssertTrue(report.files_deleted == 3U, "stops once the excess is covered");
    AssertTrue(report.deletion_failures == 0U, "no failures");
    for (int i = 0; i < 3; ++i) {
      AssertTrue(!fs::exists(temp.path() / ArtifactName(i)), "oldest artifacts evicted");
    }
    for (int i = 3; i < 12; ++i) {
      AssertTrue(fs::exists(temp.path() / ArtifactName(i)), "newer artifacts kept");
    }

    std::uint64_t usage = 0;
    if (!enforcer.MeasureUsageBytes(usage, error)) {
      Fail("measuring usage failed: " + error);
    }
    AssertTrue(usage <= 90U * kMiB, "usage at or under the watermark afterwards");
    AssertTrue(sink.Count(cosmicam::events::EventType::kQuotaEnforced) == 1U,
               "quota event emitted");

    // A lowered quota applies on the next pass.
    enforcer.SetMaxBytes(50.0 * kMiB);
    const cosmicam::storage::QuotaReport second = enforcer.EnforceIfNeeded();
    AssertTrue(second.cleanup_performed, "lower quota triggers cleanup");
    AssertTrue(second.usage_before_bytes - second.bytes_reclaimed <= 45U * kMiB,
               "second pass reaches the new watermark");
  }

  // Only 25 MiB is evictable: all of it goes, the shortfall is not an error,
  // and files that are not capture artifacts are never touched.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-short");
    MakeFile(temp.path() / ArtifactName(0), 10U * kMiB);
    MakeFile(temp.path() / ArtifactName(1), 15U * kMiB);
    MakeFile(temp.path() / "calibration.raw", 60U * kMiB);
    MakeFile(temp.path() / "archive" / ArtifactName(2), 35U * kMiB);

    // Symlinked data outside the directory is not counted.
    cosmicam::tests::common::ScopedTempDir outside("cosmicam-quota-outside");
    MakeFile(outside.path() / "huge.bin", 500U * kMiB);
    fs::create_symlink(outside.path() / "huge.bin", temp.path() / "link.jpg");

    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 100.0 * kMiB, logger);
    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(report.error.empty(), "partial reclamation is not an error");
    AssertTrue(report.usage_before_bytes == 120U * kMiB, "recursive usage without symlinks");
    AssertTrue(report.bytes_to_free == 30U * kMiB, "excess over the watermark");
    AssertTrue(report.bytes_reclaimed == 25U * kMiB, "all evictable bytes reclaimed");
    AssertTrue(report.files_deleted == 2U, "both artifacts deleted");
    AssertTrue(fs::exists(temp.path() / "calibration.raw"), "operator file kept");
    AssertTrue(fs::exists(temp.path() / "archive" / ArtifactName(2)),
               "nested artifacts are not eviction candidates");
    AssertTrue(fs::exists(outside.path() / "huge.bin"), "symlink target untouched");
  }

  // Eviction follows creation time, not the time encoded in the name.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-ctime");
    MakeFile(temp.path() / ArtifactName(2), 10U * kMiB);
    MakeFile(temp.path() / ArtifactName(0), 10U * kMiB);
    MakeFile(temp.path() / ArtifactName(1), 10U * kMiB);
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 28.0 * kMiB, logger);

    std::vector<cosmicam::camera::ImageFileInfo> candidates;
    std::string error;
    if (!enforcer.ListCandidatesOldestFirst(candidates, error)) {
      Fail("listing candidates failed: " + error);
    }
    AssertTrue(candidates.size() == 3U, "three candidates");
    AssertTrue(candidates[0].path.filename() == ArtifactName(2), "earliest created listed first");
    AssertTrue(candidates[1].path.filename() == ArtifactName(0), "then the second created");
    AssertTrue(candidates[2].path.filename() == ArtifactName(1), "then the newest");

    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(report.files_deleted == 1U, "one file covers the excess");
    AssertTrue(!fs::exists(temp.path() / ArtifactName(2)),
               "earliest created evicted although its name sorts last");
    AssertTrue(fs::exists(temp.path() / ArtifactName(0)), "later creation kept");
    AssertTrue(fs::exists(temp.path() / ArtifactName(1)), "newest kept");
  }

  // A candidate that cannot be removed is counted and skipped; the next-oldest
  // one is evicted instead.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-stuck");
    // A non-empty directory under an artifact name fails removal even as root.
    MakeFile(temp.path() / ArtifactName(0) / "pinned.txt", 1U);
    for (int i = 1; i <= 3; ++i) {
      MakeFile(temp.path() / ArtifactName(i), 10U * kMiB);
    }
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 100.0 * kMiB, logger);

    std::vector<cosmicam::camera::ImageFileInfo> candidates(4U);
    for (int i = 0; i <= 3; ++i) {
      candidates[static_cast<std::size_t>(i)].path = temp.path() / ArtifactName(i);
      candidates[static_cast<std::size_t>(i)].size_bytes = 10U * kMiB;
    }
    cosmicam::storage::QuotaReport report;
    report.bytes_to_free = 15U * kMiB;
    enforcer.EvictOldestFirst(candidates, report);

    AssertTrue(report.deletion_failures == 1U, "stuck candidate counted as a failure");
    AssertTrue(report.files_deleted == 2U, "two files removed after the failure");
    AssertTrue(report.bytes_reclaimed == 20U * kMiB, "only removed files count as reclaimed");
    AssertTrue(fs::exists(temp.path() / ArtifactName(0) / "pinned.txt"), "stuck entry left alone");
    AssertTrue(!fs::exists(temp.path() / ArtifactName(1)), "next-oldest evicted");
    AssertTrue(!fs::exists(temp.path() / ArtifactName(2)), "following one evicted");
    AssertTrue(fs::exists(temp.path() / ArtifactName(3)), "newest kept once the excess is covered");
    AssertContains(log_text.str(), "failed to delete artifact");
  }

  // A candidate that vanished after listing is a failure too.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-vanished");
    MakeFile(temp.path() / ArtifactName(0), 10U * kMiB);
    MakeFile(temp.path() / ArtifactName(1), 10U * kMiB);
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 100.0 * kMiB, logger);

    std::vector<cosmicam::camera::ImageFileInfo> candidates;
    std::string error;
    if (!enforcer.ListCandidatesOldestFirst(candidates, error)) {
      Fail("listing candidates failed: " + error);
    }
    fs::remove(temp.path() / ArtifactName(0));

    cosmicam::storage::QuotaReport report;
    report.bytes_to_free = 5U * kMiB;
    enforcer.EvictOldestFirst(candidates, report);
    AssertTrue(report.deletion_failures == 1U, "vanished file counted as a failure");
    AssertTrue(report.files_deleted == 1U, "next-oldest deleted");
    AssertTrue(report.bytes_reclaimed == 10U * kMiB, "vanished file not counted as reclaimed");
    AssertTrue(!fs::exists(temp.path() / ArtifactName(1)), "next-oldest gone");
    AssertContains(log_text.str(), "file vanished");
  }

  // A quota beyond the byte counter's range reads as unlimited.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-huge");
    MakeFile(temp.path() / ArtifactName(0), 1U * kMiB);
    cosmicam::storage::QuotaEnforcer enforcer(temp.path(), 1.0e30, logger);
    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(report.max_bytes == std::numeric_limits<std::uint64_t>::max(),
               "reported quota saturates");
    AssertTrue(!report.cleanup_performed, "nothing to clean");
  }

  // A directory that does not exist yet has no usage.
  {
    cosmicam::tests::common::ScopedTempDir temp("cosmicam-quota-missing");
    cosmicam::storage::QuotaEnforcer enforcer(temp.path() / "images", 1.0, logger);
    const cosmicam::storage::QuotaReport report = enforcer.EnforceIfNeeded();
    AssertTrue(report.error.empty() && !report.cleanup_performed,
               "missing directory is an empty one");
  }

  return 0;
}
