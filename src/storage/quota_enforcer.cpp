#include "storage/quota_enforcer.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cosmicam::storage {

namespace {

// Saturates instead of casting out of range, so an absurd stored quota reads
// as "unlimited" rather than wrapping.
std::uint64_t ToByteCount(const double value) {
  if (!(value > 0.0)) {
    return 0U;
  }
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  if (value >= static_cast<double>(kMax)) {
    return kMax;
  }
  return static_cast<std::uint64_t>(std::ceil(value));
}

} // namespace

QuotaEnforcer::QuotaEnforcer(fs::path image_dir, const double max_bytes,
                             core::logging::Logger& logger, events::Emitter* emitter)
    : image_dir_(std::move(image_dir)), max_bytes_(max_bytes), logger_(logger),
      emitter_(emitter) {}

void QuotaEnforcer::SetMaxBytes(const double max_bytes) {
  if (max_bytes != max_bytes_) {
    logger_.Info("disk quota changed",
                 {{"old_max_bytes", std::to_string(ToByteCount(max_bytes_))},
                  {"new_max_bytes", std::to_string(ToByteCount(max_bytes))}});
  }
  max_bytes_ = max_bytes;
}

bool QuotaEnforcer::MeasureUsageBytes(std::uint64_t& usage_bytes, std::string& error) const {
  usage_bytes = 0U;
  error.clear();

  std::error_code ec;
  if (!fs::exists(image_dir_, ec)) {
    // Nothing captured yet.
    return true;
  }
  fs::recursive_directory_iterator it(image_dir_,
                                      fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    error = "failed to walk image directory '" + image_dir_.string() + "': " + ec.message();
    return false;
  }

  return core::ForEachDirectoryEntry(
      std::move(it), image_dir_,
      [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || entry_ec) {
          return;
        }
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
          return;
        }
        const std::uintmax_t size = entry.file_size(entry_ec);
        if (entry_ec) {
          logger_.Warn("skipping unreadable file in usage walk",
                       {{"path", entry.path().string()}, {"error", entry_ec.message()}});
          return;
        }
        usage_bytes += static_cast<std::uint64_t>(size);
      },
      error);
}

bool QuotaEnforcer::ListCandidatesOldestFirst(std::vector<camera::ImageFileInfo>& candidates,
                                              std::string& error) const {
  candidates.clear();
  error.clear();

  std::error_code ec;
  fs::directory_iterator it(image_dir_, ec);
  if (ec) {
    error = "failed to list image directory '" + image_dir_.string() + "': " + ec.message();
    return false;
  }

  const bool listed = core::ForEachDirectoryEntry(
      std::move(it), image_dir_,
      [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_regular_file(entry_ec) || entry_ec) {
          return;
        }
        if (!camera::IsCaptureArtifactName(entry.path().filename().string())) {
          return;
        }

        camera::ImageFileInfo info;
        info.path = entry.path();
        std::string stat_error;
        if (!camera::ReadCreationTime(info.path, info.created_at, stat_error)) {
          logger_.Warn("skipping artifact without timestamp",
                       {{"path", info.path.string()}, {"error", stat_error}});
          return;
        }
        info.size_bytes = static_cast<std::uint64_t>(entry.file_size(entry_ec));
        if (entry_ec) {
          logger_.Warn("skipping artifact without size",
                       {{"path", info.path.string()}, {"error", entry_ec.message()}});
          return;
        }
        candidates.push_back(std::move(info));
      },
      error);
  if (!listed) {
    candidates.clear();
    return false;
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const camera::ImageFileInfo& lhs, const camera::ImageFileInfo& rhs) {
              if (lhs.created_at != rhs.created_at) {
                return lhs.created_at < rhs.created_at;
              }
              return lhs.path.filename() < rhs.path.filename();
            });
  return true;
}

QuotaReport QuotaEnforcer::EnforceIfNeeded() {
  QuotaReport report;
  report.max_bytes = ToByteCount(max_bytes_);

  if (!MeasureUsageBytes(report.usage_before_bytes, report.error)) {
    logger_.Error("disk usage measurement failed", {{"error", report.error}});
    return report;
  }
  if (static_cast<double>(report.usage_before_bytes) <= max_bytes_) {
    logger_.Debug("disk usage within quota",
                  {{"usage_bytes", std::to_string(report.usage_before_bytes)},
                   {"max_bytes", std::to_string(report.max_bytes)}});
    return report;
  }

  const double target = max_bytes_ * kQuotaWatermark;
  report.target_bytes = ToByteCount(std::floor(target));
  report.bytes_to_free = ToByteCount(static_cast<double>(report.usage_before_bytes) - target);
  report.cleanup_performed = true;

  logger_.Warn("disk quota exceeded, evicting oldest captures",
               {{"usage_bytes", std::to_string(report.usage_before_bytes)},
                {"max_bytes", std::to_string(report.max_bytes)},
                {"bytes_to_free", std::to_string(report.bytes_to_free)}});

  std::vector<camera::ImageFileInfo> candidates;
  std::string list_error;
  if (!ListCandidatesOldestFirst(candidates, list_error)) {
    logger_.Error("cannot list eviction candidates", {{"error", list_error}});
    report.error = list_error;
    EmitReport(report);
    return report;
  }

  EvictOldestFirst(candidates, report);

  if (report.bytes_reclaimed < report.bytes_to_free) {
    logger_.Warn("quota target not reached, no more capture artifacts to evict",
                 {{"bytes_reclaimed", std::to_string(report.bytes_reclaimed)},
                  {"bytes_to_free", std::to_string(report.bytes_to_free)}});
  } else {
    logger_.Info("disk quota enforced",
                 {{"bytes_reclaimed", std::to_string(report.bytes_reclaimed)},
                  {"files_deleted", std::to_string(report.files_deleted)}});
  }
  EmitReport(report);
  return report;
}

void QuotaEnforcer::EvictOldestFirst(const std::vector<camera::ImageFileInfo>& candidates,
                                     QuotaReport& report) const {
  for (const camera::ImageFileInfo& candidate : candidates) {
    if (report.bytes_reclaimed >= report.bytes_to_free) {
      break;
    }
    std::error_code ec;
    if (!fs::remove(candidate.path, ec) || ec) {
      ++report.deletion_failures;
      logger_.Warn("failed to delete artifact",
                   {{"path", candidate.path.string()},
                    {"error", ec ? ec.message() : std::string("file vanished")}});
      continue;
    }
    report.bytes_reclaimed += candidate.size_bytes;
    ++report.files_deleted;
    logger_.Info("deleted artifact", {{"path", candidate.path.string()},
                                      {"size_bytes", std::to_string(candidate.size_bytes)}});
  }
}

void QuotaEnforcer::EmitReport(const QuotaReport& report) const {
  if (emitter_ == nullptr) {
    return;
  }
  events::Emitter::QuotaEnforcedEvent event;
  event.ts = std::chrono::system_clock::now();
  event.usage_before_bytes = report.usage_before_bytes;
  event.max_bytes = report.max_bytes;
  event.bytes_to_free = report.bytes_to_free;
  event.bytes_reclaimed = report.bytes_reclaimed;
  event.files_deleted = report.files_deleted;
  event.deletion_failures = report.deletion_failures;

  std::string error;
  if (!emitter_->EmitQuotaEnforced(event, error)) {
    logger_.Warn("failed to record quota event", {{"error", error}});
  }
}

} // namespace cosmicam::storage
