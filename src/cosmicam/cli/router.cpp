#include "cosmicam/cli/router.hpp"

#include "camera/image_processor.hpp"
#include "camera/libcamera_still_backend.hpp"
#include "camera/profile_manager.hpp"
#include "capture/capture_queries.hpp"
#include "capture/capture_service.hpp"
#include "config/settings_model.hpp"
#include "config/settings_store.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "events/jsonl_writer.hpp"
#include "storage/quota_enforcer.hpp"
#include "sun/sun_phase.hpp"

#include <atomic>
#include <charconv>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

namespace fs = std::filesystem;

namespace cosmicam::cli {

namespace {

constexpr std::string_view kVersion = "cosmicam 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitCaptureFailed = core::errors::ToInt(core::errors::ExitCode::kCaptureFailed);
constexpr int kExitNoArtifacts = core::errors::ToInt(core::errors::ExitCode::kNoArtifacts);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  cosmicam run [common options] [--capture-command <exe>] "
         "[--capture-timeout <seconds>] [--retry-delay <seconds>]\n"
      << "  cosmicam capture [common options] [--capture-command <exe>] "
         "[--capture-timeout <seconds>]\n"
      << "  cosmicam phase [common options] [--at <YYYYMMDD_HHMMSS>]\n"
      << "  cosmicam profile [common options]\n"
      << "  cosmicam latest [common options]\n"
      << "  cosmicam set-coordinates <latitude> <longitude> [common options]\n"
      << "  cosmicam set-profile <name> [--shutter-speed <us>] [--gain <g>] "
         "[--brightness <b>] [--contrast <c>] [common options]\n"
      << "  cosmicam cleanup [common options]\n"
      << "  cosmicam version\n"
      << "\n"
      << "common options:\n"
      << "  --config-dir <dir> --image-dir <dir> --events <events.jsonl>\n"
      << "  --log-level <debug|info|warn|error> --log-file <path>\n";
}

// Parsed argv after the subcommand: process options, positionals and the
// command-specific flags. Each command rejects what it does not accept.
struct CommandLine {
  ServiceOptions options;
  std::vector<std::string> positionals;
  config::CameraProfilePatch patch;
  std::optional<std::chrono::system_clock::time_point> at;
  bool has_capture_flags = false;
  bool has_retry_flag = false;
};

bool ParseUnsigned(std::string_view raw, std::uint64_t& value) {
  if (raw.empty()) {
    return false;
  }
  const auto* begin = raw.data();
  const auto* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

bool ParseFiniteDouble(std::string_view raw, double& value) {
  if (raw.empty()) {
    return false;
  }
  const std::string text(raw);
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end == text.c_str() + text.size() && std::isfinite(value);
}

bool ParseCommandLine(const std::vector<std::string_view>& args, CommandLine& command_line,
                      std::string& error) {
  ServiceOptions& options = command_line.options;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool is_flag = token.size() > 2U && token.substr(0, 2) == "--";
    if (!is_flag) {
      command_line.positionals.emplace_back(token);
      continue;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--config-dir") {
      options.config_dir = fs::path(value);
    } else if (token == "--image-dir") {
      options.image_dir = fs::path(value);
    } else if (token == "--events") {
      options.events_path = fs::path(value);
    } else if (token == "--log-file") {
      options.log_file = fs::path(value);
    } else if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else if (token == "--capture-command") {
      if (value.empty()) {
        error = "--capture-command cannot be empty";
        return false;
      }
      options.capture_command = std::string(value);
      command_line.has_capture_flags = true;
    } else if (token == "--capture-timeout") {
      std::uint64_t seconds = 0;
      if (!ParseUnsigned(value, seconds) || seconds == 0U) {
        error = "--capture-timeout must be a positive number of seconds";
        return false;
      }
      options.capture_timeout = std::chrono::seconds(seconds);
      command_line.has_capture_flags = true;
    } else if (token == "--retry-delay") {
      std::uint64_t seconds = 0;
      if (!ParseUnsigned(value, seconds) || seconds == 0U) {
        error = "--retry-delay must be a positive number of seconds";
        return false;
      }
      options.retry_delay = std::chrono::seconds(seconds);
      command_line.has_retry_flag = true;
    } else if (token == "--at") {
      const auto parsed = core::ParseCompactUtcStamp(std::string(value));
      if (!parsed.has_value()) {
        error = "--at expects a UTC time as YYYYMMDD_HHMMSS";
        return false;
      }
      command_line.at = *parsed;
    } else if (token == "--shutter-speed") {
      std::uint64_t shutter = 0;
      if (!ParseUnsigned(value, shutter)) {
        error = "--shutter-speed must be a non-negative integer (microseconds)";
        return false;
      }
      command_line.patch.shutter_speed = shutter;
    } else if (token == "--gain") {
      double gain = 0.0;
      if (!ParseFiniteDouble(value, gain) || gain < 0.0) {
        error = "--gain must be a non-negative number";
        return false;
      }
      command_line.patch.gain = gain;
    } else if (token == "--brightness") {
      double brightness = 0.0;
      if (!ParseFiniteDouble(value, brightness)) {
        error = "--brightness must be a number";
        return false;
      }
      command_line.patch.brightness = brightness;
    } else if (token == "--contrast") {
      double contrast = 0.0;
      if (!ParseFiniteDouble(value, contrast) || contrast <= 0.0) {
        error = "--contrast must be a positive number";
        return false;
      }
      command_line.patch.contrast = contrast;
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }
  return true;
}

// Parses and applies the per-command acceptance rules in one place so every
// command reports misuse the same way.
bool ParseFor(std::string_view command, const std::vector<std::string_view>& args,
              std::size_t positional_count, bool accepts_capture_flags, bool accepts_retry,
              bool accepts_patch, bool accepts_at, CommandLine& command_line) {
  std::string error;
  if (!ParseCommandLine(args, command_line, error)) {
    std::cerr << "error: " << error << '\n';
    return false;
  }
  if (command_line.positionals.size() != positional_count) {
    std::cerr << "error: " << command << " expects " << positional_count
              << " positional argument(s), got " << command_line.positionals.size() << '\n';
    return false;
  }
  if (command_line.has_capture_flags && !accepts_capture_flags) {
    std::cerr << "error: " << command << " does not take capture options\n";
    return false;
  }
  if (command_line.has_retry_flag && !accepts_retry) {
    std::cerr << "error: " << command << " does not take --retry-delay\n";
    return false;
  }
  if (!command_line.patch.empty() && !accepts_patch) {
    std::cerr << "error: profile fields are only accepted by set-profile\n";
    return false;
  }
  if (command_line.at.has_value() && !accepts_at) {
    std::cerr << "error: --at is only accepted by phase\n";
    return false;
  }
  return true;
}

// Owns the long-lived objects a command needs, wired in dependency order:
// log sink, logger, settings store, event sink, profile manager.
class Runtime {
public:
  int Open(const ServiceOptions& options, std::string_view component) {
    if (!options.log_file.empty()) {
      std::string error;
      if (!core::EnsureParentDirectory(options.log_file, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitFailure;
      }
      log_file_.open(options.log_file, std::ios::app);
      if (!log_file_) {
        std::cerr << "error: unable to open log file: " << options.log_file.string() << '\n';
        return kExitFailure;
      }
      logger_ = std::make_unique<core::logging::Logger>(options.log_level, log_file_);
    } else {
      logger_ = std::make_unique<core::logging::Logger>(options.log_level, std::cerr);
    }
    logger_->SetComponent(std::string(component));

    store_ = std::make_unique<config::JsonFileSettingsStore>(options.config_dir, *logger_);
    std::string error;
    if (!store_->Initialize(error)) {
      logger_->Error("settings store unavailable", {{"error", error}});
      std::cerr << "error: failed to open settings in " << options.config_dir.string() << ": "
                << error << '\n';
      return kExitConfigInvalid;
    }

    if (options.events_path.has_value()) {
      sink_ = std::make_unique<events::JsonlEventSink>(*options.events_path);
    }
    emitter_ = std::make_unique<events::Emitter>(sink_.get());
    profiles_ = std::make_unique<camera::CameraProfileManager>(*store_, *logger_, emitter_.get());
    return kExitSuccess;
  }

  core::logging::Logger& logger() {
    return *logger_;
  }
  config::JsonFileSettingsStore& store() {
    return *store_;
  }
  events::Emitter& emitter() {
    return *emitter_;
  }
  camera::CameraProfileManager& profiles() {
    return *profiles_;
  }

private:
  std::ofstream log_file_;
  std::unique_ptr<core::logging::Logger> logger_;
  std::unique_ptr<config::JsonFileSettingsStore> store_;
  std::unique_ptr<events::JsonlEventSink> sink_;
  std::unique_ptr<events::Emitter> emitter_;
  std::unique_ptr<camera::CameraProfileManager> profiles_;
};

// Turns SIGINT/SIGTERM into a callback on a dedicated thread. The signals
// are blocked for the whole process while the watcher lives, so the callback
// runs in normal thread context and may take locks.
class SignalWatcher {
public:
  explicit SignalWatcher(std::function<void(int)> on_signal) : on_signal_(std::move(on_signal)) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    (void)pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    thread_ = std::thread([this] { Watch(); });
  }

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  ~SignalWatcher() {
    done_.store(true);
    (void)pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
    (void)pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
  }

private:
  void Watch() {
    while (true) {
      int signal_number = 0;
      if (sigwait(&signals_, &signal_number) != 0 || done_.load()) {
        return;
      }
      on_signal_(signal_number);
    }
  }

  std::function<void(int)> on_signal_;
  sigset_t signals_{};
  sigset_t previous_mask_{};
  std::atomic<bool> done_{false};
  std::thread thread_;
};

camera::LibcameraStillOptions BuildBackendOptions(const ServiceOptions& options) {
  camera::LibcameraStillOptions backend_options;
  backend_options.executable = options.capture_command;
  backend_options.timeout = options.capture_timeout;
  return backend_options;
}

void PrintProfile(std::ostream& out, const std::string& name,
                  const config::CameraProfile& profile) {
  out << "profile: " << name << '\n';
  for (const auto& [key, value] : config::DescribeFields(profile)) {
    out << "  " << key << ": " << value << '\n';
  }
}

void PrintPhase(std::ostream& out, const sun::SunPhaseResult& phase) {
  out << "sun_phase: " << sun::ToString(phase.phase) << '\n';
  out << "altitude_deg: " << core::FormatJsonNumber(phase.altitude_degrees) << '\n';
  if (phase.degraded) {
    out << "degraded: " << phase.error << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("run", args, 0U, true, true, false, false, command_line)) {
    return kExitUsage;
  }
  const ServiceOptions& options = command_line.options;

  Runtime runtime;
  if (const int code = runtime.Open(options, "camera"); code != kExitSuccess) {
    return code;
  }

  camera::LibcameraStillBackend backend(BuildBackendOptions(options), runtime.logger());
  camera::PassThroughProcessor processor(runtime.logger());
  capture::CaptureServiceOptions service_options;
  service_options.image_dir = options.image_dir;
  service_options.retry_delay = options.retry_delay;
  capture::CaptureService service(service_options, runtime.store(), runtime.profiles(), backend,
                                  processor, runtime.logger(), &runtime.emitter());

  std::string error;
  bool started = false;
  {
    SignalWatcher watcher([&](const int signal_number) {
      runtime.logger().Info("stop requested", {{"signal", std::to_string(signal_number)}});
      service.Stop();
    });
    started = service.Start(error);
  }
  if (!started) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const capture::CaptureCounters counters = service.Counters();
  std::cout << "cycles: " << counters.cycles << '\n';
  std::cout << "captures_succeeded: " << counters.successes << '\n';
  std::cout << "captures_failed: " << counters.failures << '\n';
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("capture", args, 0U, true, false, false, false, command_line)) {
    return kExitUsage;
  }
  const ServiceOptions& options = command_line.options;

  Runtime runtime;
  if (const int code = runtime.Open(options, "camera"); code != kExitSuccess) {
    return code;
  }
  std::string error;
  if (!core::EnsureDirectory(options.image_dir, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  camera::LibcameraStillBackend backend(BuildBackendOptions(options), runtime.logger());
  camera::PassThroughProcessor processor(runtime.logger());
  capture::CaptureServiceOptions service_options;
  service_options.image_dir = options.image_dir;
  capture::CaptureService service(service_options, runtime.store(), runtime.profiles(), backend,
                                  processor, runtime.logger(), &runtime.emitter());

  const capture::IterationResult result = service.RunIteration();
  if (!result.capture_succeeded) {
    std::cerr << "error: capture failed: " << result.error << '\n';
    return kExitCaptureFailed;
  }
  std::cout << "artifact: " << result.artifact_path.string() << '\n';
  PrintProfile(std::cout, result.profile_name, runtime.profiles().CurrentSettings());
  if (result.quota.cleanup_performed) {
    std::cout << "quota_files_deleted: " << result.quota.files_deleted << '\n';
  }
  return kExitSuccess;
}

int CommandPhase(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("phase", args, 0U, false, false, false, true, command_line)) {
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "cli"); code != kExitSuccess) {
    return code;
  }

  const sun::GeoCoordinates coordinates = runtime.profiles().Coordinates();
  const auto instant = command_line.at.value_or(std::chrono::system_clock::now());
  const sun::SunPhaseResult phase = sun::ComputeSunPhase(instant, coordinates, runtime.logger());

  std::cout << "ts_utc: " << core::FormatUtcTimestamp(instant) << '\n';
  std::cout << "latitude: " << core::FormatJsonNumber(coordinates.latitude) << '\n';
  std::cout << "longitude: " << core::FormatJsonNumber(coordinates.longitude) << '\n';
  PrintPhase(std::cout, phase);
  return kExitSuccess;
}

int CommandProfile(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("profile", args, 0U, false, false, false, false, command_line)) {
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "cli"); code != kExitSuccess) {
    return code;
  }

  capture::CaptureQueries queries(command_line.options.image_dir, runtime.profiles(),
                                  runtime.logger());
  const capture::CurrentProfileView view = queries.GetCurrentProfile();
  PrintProfile(std::cout, view.profile_name, view.settings);
  PrintPhase(std::cout, view.phase);
  return kExitSuccess;
}

int CommandLatest(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("latest", args, 0U, false, false, false, false, command_line)) {
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "cli"); code != kExitSuccess) {
    return code;
  }

  capture::CaptureQueries queries(command_line.options.image_dir, runtime.profiles(),
                                  runtime.logger());
  capture::LatestArtifact latest;
  std::string error;
  if (!queries.GetLatestArtifact(latest, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitNoArtifacts;
  }

  std::cout << "path: " << latest.path.string() << '\n';
  std::cout << "timestamp: " << core::FormatUtcTimestamp(latest.timestamp) << '\n';
  std::cout << "size_bytes: " << latest.size_bytes << '\n';
  PrintPhase(std::cout, latest.phase);
  PrintProfile(std::cout, latest.profile_name, latest.profile_settings);
  return kExitSuccess;
}

int CommandSetCoordinates(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("set-coordinates", args, 2U, false, false, false, false, command_line)) {
    return kExitUsage;
  }

  sun::GeoCoordinates requested;
  if (!ParseFiniteDouble(command_line.positionals[0], requested.latitude) ||
      !ParseFiniteDouble(command_line.positionals[1], requested.longitude)) {
    std::cerr << "error: latitude and longitude must be numbers\n";
    return kExitUsage;
  }
  if (!sun::IsValidCoordinates(requested)) {
    std::cerr << "error: latitude must be in [-90, 90] and longitude in [-180, 180]\n";
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "config"); code != kExitSuccess) {
    return code;
  }

  capture::CaptureQueries queries(command_line.options.image_dir, runtime.profiles(),
                                  runtime.logger());
  std::string error;
  if (!queries.UpdateCoordinates(requested.latitude, requested.longitude, error)) {
    std::cerr << "error: failed to update coordinates: " << error << '\n';
    return kExitConfigInvalid;
  }

  const capture::CurrentProfileView view = queries.GetCurrentProfile();
  std::cout << "coordinates updated: " << core::FormatJsonNumber(view.coordinates.latitude)
            << ", " << core::FormatJsonNumber(view.coordinates.longitude) << '\n';
  PrintPhase(std::cout, view.phase);
  std::cout << "profile: " << view.profile_name << '\n';
  return kExitSuccess;
}

int CommandSetProfile(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("set-profile", args, 1U, false, false, true, false, command_line)) {
    return kExitUsage;
  }
  if (command_line.patch.empty()) {
    std::cerr << "error: set-profile needs at least one of --shutter-speed, --gain, "
                 "--brightness, --contrast\n";
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "config"); code != kExitSuccess) {
    return code;
  }

  const std::string& name = command_line.positionals.front();
  std::string error;
  if (!runtime.profiles().UpdateProfile(name, command_line.patch, error)) {
    std::cerr << "error: failed to update profile '" << name << "': " << error << '\n';
    return kExitConfigInvalid;
  }

  const config::ProfileMap profiles = runtime.profiles().Profiles();
  PrintProfile(std::cout, name, profiles.at(name));
  return kExitSuccess;
}

int CommandCleanup(const std::vector<std::string_view>& args) {
  CommandLine command_line;
  command_line.options = DefaultServiceOptions();
  if (!ParseFor("cleanup", args, 0U, false, false, false, false, command_line)) {
    return kExitUsage;
  }

  Runtime runtime;
  if (const int code = runtime.Open(command_line.options, "system"); code != kExitSuccess) {
    return code;
  }

  config::SystemSettings settings = config::DefaultSystemSettings();
  std::string error;
  if (!config::ReadSystemSettings(runtime.store(), settings, error)) {
    std::cerr << "error: failed to read system settings: " << error << '\n';
    return kExitConfigInvalid;
  }

  storage::QuotaEnforcer enforcer(command_line.options.image_dir, settings.max_disk_usage_bytes,
                                  runtime.logger(), &runtime.emitter());
  const storage::QuotaReport report = enforcer.EnforceIfNeeded();
  if (!report.error.empty()) {
    std::cerr << "error: " << report.error << '\n';
    return kExitFailure;
  }

  std::cout << "usage_bytes: " << report.usage_before_bytes << '\n';
  std::cout << "max_bytes: " << report.max_bytes << '\n';
  std::cout << "cleanup_performed: " << (report.cleanup_performed ? "true" : "false") << '\n';
  if (report.cleanup_performed) {
    std::cout << "target_bytes: " << report.target_bytes << '\n';
    std::cout << "bytes_to_free: " << report.bytes_to_free << '\n';
    std::cout << "bytes_reclaimed: " << report.bytes_reclaimed << '\n';
    std::cout << "files_deleted: " << report.files_deleted << '\n';
    std::cout << "deletion_failures: " << report.deletion_failures << '\n';
  }
  return kExitSuccess;
}

} // namespace

ServiceOptions DefaultServiceOptions() {
  ServiceOptions options;
  const char* root = std::getenv("COSMICAM_ROOT");
  if (root != nullptr && root[0] != '\0') {
    const fs::path base(root);
    options.config_dir = base / "config";
    options.image_dir = base / "images";
  }
  return options;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "capture") {
    return CommandCapture(args);
  }
  if (command == "phase") {
    return CommandPhase(args);
  }
  if (command == "profile") {
    return CommandProfile(args);
  }
  if (command == "latest") {
    return CommandLatest(args);
  }
  if (command == "set-coordinates") {
    return CommandSetCoordinates(args);
  }
  if (command == "set-profile") {
    return CommandSetProfile(args);
  }
  if (command == "cleanup") {
    return CommandCleanup(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace cosmicam::cli
