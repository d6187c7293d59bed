#pragma once

#include "camera/artifact_naming.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cosmicam::core::logging {
class Logger;
}

namespace cosmicam::events {
class Emitter;
}

namespace cosmicam::storage {

// Fraction of the quota an enforcement pass evicts down to.
constexpr double kQuotaWatermark = 0.9;

// Outcome of one enforcement pass. Partial reclamation (not enough capture
// artifacts to reach the watermark) is reported through the byte counts, not
// as an error.
struct QuotaReport {
  bool cleanup_performed = false;
  std::uint64_t usage_before_bytes = 0;
  std::uint64_t max_bytes = 0;
  std::uint64_t target_bytes = 0;
  std::uint64_t bytes_to_free = 0;
  std::uint64_t bytes_reclaimed = 0;
  std::uint64_t files_deleted = 0;
  std::uint64_t deletion_failures = 0;
  // Set when usage could not be measured at all; nothing was deleted then.
  std::string error;
};

// Keeps the artifact directory under a byte quota by deleting the oldest
// capture artifacts.
//
// - Usage counts every regular file below the directory, recursively.
//   Symlinks are not followed or counted.
// - Only files named like capture artifacts directly inside the directory
//   are ever deleted.
// - Eviction stops as soon as the reclaimed bytes cover the excess over the
//   watermark.
class QuotaEnforcer {
public:
  QuotaEnforcer(std::filesystem::path image_dir, double max_bytes, core::logging::Logger& logger,
                events::Emitter* emitter = nullptr);

  QuotaReport EnforceIfNeeded();

  void SetMaxBytes(double max_bytes);
  double max_bytes() const {
    return max_bytes_;
  }

  const std::filesystem::path& image_dir() const {
    return image_dir_;
  }

  bool MeasureUsageBytes(std::uint64_t& usage_bytes, std::string& error) const;

  // Capture artifacts ordered by creation time, then file name.
  bool ListCandidatesOldestFirst(std::vector<camera::ImageFileInfo>& candidates,
                                 std::string& error) const;

  // Deletes `candidates` in order until `report.bytes_reclaimed` covers
  // `report.bytes_to_free`. A file that cannot be removed is logged, counted
  // in `deletion_failures` and skipped.
  void EvictOldestFirst(const std::vector<camera::ImageFileInfo>& candidates,
                        QuotaReport& report) const;

private:
  void EmitReport(const QuotaReport& report) const;

  std::filesystem::path image_dir_;
  double max_bytes_ = 0.0;
  core::logging::Logger& logger_;
  events::Emitter* emitter_ = nullptr;
};

} // namespace cosmicam::storage
