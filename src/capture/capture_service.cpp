#include "capture/capture_service.hpp"

#include "camera/artifact_naming.hpp"
#include "camera/capture_backend.hpp"
#include "camera/image_processor.hpp"
#include "config/settings_store.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"

#include <algorithm>
#include <utility>

namespace cosmicam::capture {

CaptureService::CaptureService(CaptureServiceOptions options, config::ISettingsStore& store,
                               camera::CameraProfileManager& profiles,
                               camera::ICaptureBackend& backend,
                               camera::IImageProcessor& processor, core::logging::Logger& logger,
                               events::Emitter* emitter, camera::WallClock clock)
    : options_(std::move(options)), store_(store), profiles_(profiles), backend_(backend),
      processor_(processor), logger_(logger), emitter_(emitter), clock_(std::move(clock)),
      quota_(options_.image_dir, config::kDefaultMaxDiskUsageBytes, logger, emitter),
      settings_(config::DefaultSystemSettings()) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

bool CaptureService::Start(std::string& error) {
  error.clear();
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) {
      error = "capture service is already running";
      return false;
    }
    running_ = true;
  }

  if (!core::EnsureDirectory(options_.image_dir, error)) {
    std::lock_guard<std::mutex> lock(mu_);
    running_ = false;
    return false;
  }

  ReloadSystemSettings();
  quota_.SetMaxBytes(CurrentSystemSettings().max_disk_usage_bytes);

  logger_.Info("capture service started",
               {{"image_dir", options_.image_dir.string()}, {"backend", backend_.Name()}});
  EmitLifecycle(true);

  while (true) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_requested_) {
        break;
      }
    }

    const IterationResult result = RunIteration();

    std::unique_lock<std::mutex> lock(mu_);
    if (wake_.wait_for(lock, result.next_delay, [this] { return stop_requested_; })) {
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    running_ = false;
    stop_requested_ = false;
  }
  logger_.Info("capture service stopped", {{"cycles", std::to_string(Counters().cycles)}});
  EmitLifecycle(false);
  return true;
}

void CaptureService::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  wake_.notify_all();
}

bool CaptureService::IsRunning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

CaptureCounters CaptureService::Counters() const {
  std::lock_guard<std::mutex> lock(mu_);
  return counters_;
}

config::SystemSettings CaptureService::CurrentSystemSettings() const {
  std::lock_guard<std::mutex> lock(mu_);
  return settings_;
}

void CaptureService::ReloadSystemSettings() {
  config::SystemSettings loaded;
  std::string error;
  if (!config::ReadSystemSettings(store_, loaded, error)) {
    logger_.Warn("system settings unavailable, keeping previous values", {{"error", error}});
    return;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (loaded.capture_interval != settings_.capture_interval) {
    logger_.Info("capture interval changed",
                 {{"old_seconds", std::to_string(settings_.capture_interval.count())},
                  {"new_seconds", std::to_string(loaded.capture_interval.count())}});
  }
  settings_ = loaded;
}

IterationResult CaptureService::RunIteration() {
  IterationResult result;

  ReloadSystemSettings();
  const config::SystemSettings settings = CurrentSystemSettings();
  const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
      settings.capture_interval);
  const auto retry_delay = std::min(options_.retry_delay, interval);

  result.phase = profiles_.RefreshFromSunPhase();
  result.profile_name = profiles_.CurrentProfileName();

  camera::CaptureRequest request;
  request.profile = profiles_.CurrentSettings();
  request.output_path = options_.image_dir / camera::BuildArtifactFileName(clock_());

  logger_.Debug("capturing", {{"profile", result.profile_name},
                              {"sun_phase", sun::ToString(result.phase.phase)},
                              {"output", request.output_path.string()}});

  camera::CaptureResult capture;
  std::string error;
  bool ok = backend_.Capture(request, capture, error);

  std::filesystem::path artifact;
  if (ok && !processor_.Process(capture.artifact_path, artifact, error)) {
    error = "image processing failed: " + error;
    ok = false;
  }

  if (!ok) {
    std::uint64_t consecutive = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++counters_.cycles;
      ++counters_.failures;
      consecutive = ++counters_.consecutive_failures;
    }
    result.error = error;
    result.next_delay = retry_delay;
    logger_.Error("capture failed", {{"profile", result.profile_name},
                                     {"error", error},
                                     {"consecutive_failures", std::to_string(consecutive)},
                                     {"retry_in_ms", std::to_string(retry_delay.count())}});
    if (emitter_ != nullptr) {
      events::Emitter::CaptureFailedEvent event;
      event.ts = clock_();
      event.profile = result.profile_name;
      event.error = error;
      event.consecutive_failures = consecutive;
      event.retry_delay_ms = static_cast<std::uint64_t>(retry_delay.count());
      std::string emit_error;
      if (!emitter_->EmitCaptureFailed(event, emit_error)) {
        logger_.Warn("failed to record capture failure event", {{"error", emit_error}});
      }
    }
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    ++counters_.cycles;
    ++counters_.successes;
    counters_.consecutive_failures = 0;
    counters_.last_artifact = artifact;
  }
  result.capture_succeeded = true;
  result.artifact_path = artifact;
  result.next_delay = interval;
  logger_.Info("image captured", {{"path", artifact.string()},
                                  {"profile", result.profile_name},
                                  {"duration_ms", std::to_string(capture.duration.count())}});
  if (emitter_ != nullptr) {
    events::Emitter::CaptureSucceededEvent event;
    event.ts = clock_();
    event.artifact_path = artifact.string();
    event.profile = result.profile_name;
    event.sun_phase = sun::ToString(result.phase.phase);
    event.duration_ms = static_cast<std::uint64_t>(capture.duration.count());
    std::string emit_error;
    if (!emitter_->EmitCaptureSucceeded(event, emit_error)) {
      logger_.Warn("failed to record capture event", {{"error", emit_error}});
    }
  }

  quota_.SetMaxBytes(settings.max_disk_usage_bytes);
  result.quota = quota_.EnforceIfNeeded();
  return result;
}

void CaptureService::EmitLifecycle(const bool started) const {
  if (emitter_ == nullptr) {
    return;
  }
  events::Emitter::ServiceLifecycleEvent event;
  event.ts = clock_();
  event.started = started;
  event.image_dir = options_.image_dir.string();
  event.cycles = Counters().cycles;
  std::string error;
  if (!emitter_->EmitServiceLifecycle(event, error)) {
    logger_.Warn("failed to record service lifecycle event", {{"error", error}});
  }
}

} // namespace cosmicam::capture
