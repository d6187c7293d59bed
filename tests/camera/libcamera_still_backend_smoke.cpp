#include "camera/libcamera_still_backend.hpp"
#include "core/logging/logger.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>

namespace fs = std::filesystem;

using cosmicam::tests::common::AssertContains;
using cosmicam::tests::common::AssertTrue;
using cosmicam::tests::common::Fail;

namespace {

bool HasPair(const std::vector<std::string>& argv, const std::string& flag,
             const std::string& value) {
  for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
    if (argv[i] == flag && argv[i + 1] == value) {
      return true;
    }
  }
  return false;
}

bool HasFlag(const std::vector<std::string>& argv, const std::string& flag) {
  return std::find(argv.begin(), argv.end(), flag) != argv.end();
}

// Stand-in for the imaging tool: writes the `-o` target unless told to fail.
fs::path WriteFakeTool(const fs::path& dir, const std::string& name, const std::string& body) {
  const fs::path path = dir / name;
  std::ofstream out(path);
  out << "#!/bin/sh\n" << body;
  out.close();
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path;
}

} // namespace

int main() {
  cosmicam::camera::LibcameraStillOptions options;
  cosmicam::camera::CaptureRequest request;
  request.output_path = "/tmp/image_20240101_000000.jpg";

  // Default profile: auto shutter and gain, brightness 0 still passed.
  std::vector<std::string> argv = cosmicam::camera::BuildLibcameraStillCommand(options, request);
  AssertTrue(argv.front() == "libcamera-still", "executable first");
  AssertTrue(HasPair(argv, "-o", request.output_path.string()), "output path");
  AssertTrue(HasPair(argv, "--width", "4056") && HasPair(argv, "--height", "3040"),
             "sensor resolution");
  AssertTrue(!HasFlag(argv, "--shutter") && !HasFlag(argv, "--gain"),
             "auto exposure passes no shutter or gain");
  AssertTrue(HasPair(argv, "--brightness", "0"), "brightness zero is a real setting");
  AssertTrue(HasPair(argv, "--contrast", "1"), "contrast passed");

  request.profile.shutter_speed = 6'000'000U;
  request.profile.gain = 2.0;
  request.profile.brightness.reset();
  request.profile.contrast = 1.4;
  argv = cosmicam::camera::BuildLibcameraStillCommand(options, request);
  AssertTrue(HasPair(argv, "--shutter", "6000000"), "night shutter");
  AssertTrue(HasPair(argv, "--gain", "2"), "night gain");
  AssertTrue(!HasFlag(argv, "--brightness"), "unset brightness is not passed");
  AssertTrue(HasPair(argv, "--contrast", "1.4"), "night contrast");

  request.profile.contrast = 0.0;
  argv = cosmicam::camera::BuildLibcameraStillCommand(options, request);
  AssertTrue(!HasFlag(argv, "--contrast"), "non-positive contrast is not passed");

  cosmicam::tests::common::ScopedTempDir temp("cosmicam-libcamera-smoke");
  std::ostringstream log_text;
  cosmicam::core::logging::Logger logger(cosmicam::core::logging::LogLevel::kDebug, log_text);
  std::string error;
  cosmicam::camera::CaptureResult result;

  // Success: the tool writes its -o argument.
  options.executable = WriteFakeTool(temp.path(), "fake-still-ok",
                                     "while [ $# -gt 0 ]; do\n"
                                     "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; fi\n"
                                     "  shift\n"
                                     "done\n"
                                     "echo captured\n"
                                     "printf 'jpeg' > \"$out\"\n")
                           .string();
  request.output_path = temp.path() / "image_20240101_000001.jpg";
  cosmicam::camera::LibcameraStillBackend ok_backend(options, logger);
  if (!ok_backend.Capture(request, result, error)) {
    Fail("capture with working tool failed: " + error);
  }
  AssertTrue(result.artifact_path == request.output_path, "artifact path reported");
  AssertTrue(fs::file_size(result.artifact_path) == 4U, "artifact written");
  AssertContains(result.tool_output, "captured");

  // Non-zero exit removes any partial output.
  options.executable = WriteFakeTool(temp.path(), "fake-still-fail",
                                     "echo 'no cameras available' >&2\n"
                                     "exit 3\n")
                           .string();
  request.output_path = temp.path() / "image_20240101_000002.jpg";
  cosmicam::camera::LibcameraStillBackend failing_backend(options, logger);
  AssertTrue(!failing_backend.Capture(request, result, error), "failing tool must fail");
  AssertContains(error, "exited with status 3");
  AssertContains(result.tool_output, "no cameras available");
  AssertTrue(!fs::exists(request.output_path), "no artifact after failure");

  // Exit 0 without writing the file is still a failure.
  options.executable = WriteFakeTool(temp.path(), "fake-still-silent", "exit 0\n").string();
  cosmicam::camera::LibcameraStillBackend silent_backend(options, logger);
  AssertTrue(!silent_backend.Capture(request, result, error), "missing output must fail");
  AssertContains(error, "wrote no file");

  // Missing executable.
  options.executable = (temp.path() / "does-not-exist").string();
  cosmicam::camera::LibcameraStillBackend missing_backend(options, logger);
  AssertTrue(!missing_backend.Capture(request, result, error), "missing tool must fail");
  AssertContains(error, "status 127");

  // The capture loop runs with SIGINT/SIGTERM blocked; the tool must not
  // inherit that mask.
  {
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGTERM);
    sigset_t previous;
    if (::pthread_sigmask(SIG_BLOCK, &blocked, &previous) != 0) {
      Fail("blocking SIGTERM failed");
    }
    options.executable = WriteFakeTool(temp.path(), "fake-still-terminated",
                                       "kill -TERM $$\n"
                                       "sleep 5\n"
                                       "exit 0\n")
                             .string();
    options.timeout = std::chrono::seconds(10);
    cosmicam::camera::LibcameraStillBackend terminated_backend(options, logger);
    const auto started = std::chrono::steady_clock::now();
    const bool captured = terminated_backend.Capture(request, result, error);
    (void)::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    AssertTrue(!captured, "terminated tool must fail");
    AssertContains(error, "signal");
    AssertTrue(std::chrono::steady_clock::now() - started < std::chrono::seconds(4),
               "SIGTERM reaches the tool immediately");
  }

  // A hung tool is killed once the timeout elapses.
  options.executable = WriteFakeTool(temp.path(), "fake-still-hang", "exec sleep 30\n").string();
  options.timeout = std::chrono::seconds(1);
  cosmicam::camera::LibcameraStillBackend hung_backend(options, logger);
  const auto started = std::chrono::steady_clock::now();
  AssertTrue(!hung_backend.Capture(request, result, error), "hung tool must fail");
  AssertContains(error, "timed out");
  AssertTrue(std::chrono::steady_clock::now() - started < std::chrono::seconds(10),
             "timeout must bound the wait");

  return 0;
}
