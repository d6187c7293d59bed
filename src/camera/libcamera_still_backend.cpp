#include "camera/libcamera_still_backend.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cosmicam::camera {

namespace {

constexpr std::size_t kMaxToolOutputBytes = 64U * 1024U;

struct ChildOutcome {
  int wait_status = 0;
  bool timed_out = false;
  std::string output;
};

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string joined;
  for (const std::string& arg : argv) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += arg;
  }
  return joined;
}

std::string ErrnoMessage(std::string_view what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool SpawnAndWait(const std::vector<std::string>& argv,
                  const std::optional<std::chrono::seconds>& timeout, ChildOutcome& outcome,
                  std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    error = ErrnoMessage("pipe failed");
    return false;
  }
  (void)::fcntl(fds[0], F_SETFD, FD_CLOEXEC);

  std::vector<char*> child_argv;
  child_argv.reserve(argv.size() + 1U);
  for (const std::string& arg : argv) {
    child_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = ErrnoMessage("fork failed");
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }

  if (pid == 0) {
    // The daemon blocks SIGINT/SIGTERM for its signal-watch thread; the tool
    // must still die on them.
    sigset_t unblocked;
    sigemptyset(&unblocked);
    (void)::pthread_sigmask(SIG_SETMASK, &unblocked, nullptr);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    ::execvp(child_argv[0], child_argv.data());
    _exit(127);
  }

  ::close(fds[1]);
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (timeout.has_value()) {
    deadline = std::chrono::steady_clock::now() + *timeout;
  }

  char buffer[4096];
  while (true) {
    int poll_timeout_ms = -1;
    if (deadline.has_value()) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          *deadline - std::chrono::steady_clock::now());
      poll_timeout_ms = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    }

    pollfd pfd{};
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, poll_timeout_ms);
    if (ready == 0) {
      outcome.timed_out = true;
      (void)::kill(pid, SIGKILL);
      break;
    }
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      const std::size_t room = kMaxToolOutputBytes - std::min(kMaxToolOutputBytes,
                                                              outcome.output.size());
      outcome.output.append(buffer, std::min(room, static_cast<std::size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  ::close(fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      error = ErrnoMessage("waitpid failed");
      return false;
    }
  }
  outcome.wait_status = status;
  return true;
}

void RemovePartialOutput(const fs::path& path) {
  std::error_code ec;
  (void)fs::remove(path, ec);
}

} // namespace

std::vector<std::string> BuildLibcameraStillCommand(const LibcameraStillOptions& options,
                                                    const CaptureRequest& request) {
  std::vector<std::string> argv = {
      options.executable,
      "-o",
      request.output_path.string(),
      "--width",
      std::to_string(options.width),
      "--height",
      std::to_string(options.height),
  };

  const config::CameraProfile& profile = request.profile;
  if (profile.shutter_speed > 0U) {
    argv.push_back("--shutter");
    argv.push_back(std::to_string(profile.shutter_speed));
  }
  if (profile.gain > 0.0) {
    argv.push_back("--gain");
    argv.push_back(core::FormatJsonNumber(profile.gain));
  }
  if (profile.brightness.has_value()) {
    argv.push_back("--brightness");
    argv.push_back(core::FormatJsonNumber(*profile.brightness));
  }
  if (profile.contrast > 0.0) {
    argv.push_back("--contrast");
    argv.push_back(core::FormatJsonNumber(profile.contrast));
  }
  return argv;
}

LibcameraStillBackend::LibcameraStillBackend(LibcameraStillOptions options,
                                             core::logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

bool LibcameraStillBackend::Capture(const CaptureRequest& request, CaptureResult& result,
                                    std::string& error) {
  result = CaptureResult{};
  error.clear();

  const std::vector<std::string> argv = BuildLibcameraStillCommand(options_, request);
  logger_.Info("executing capture command", {{"command", JoinCommand(argv)}});

  const auto started = std::chrono::steady_clock::now();
  ChildOutcome outcome;
  if (!SpawnAndWait(argv, options_.timeout, outcome, error)) {
    return false;
  }
  result.duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started);
  result.tool_output = std::move(outcome.output);

  if (outcome.timed_out) {
    RemovePartialOutput(request.output_path);
    error = options_.executable + " timed out after " +
            std::to_string(options_.timeout.value_or(std::chrono::seconds(0)).count()) + "s";
    return false;
  }
  if (WIFSIGNALED(outcome.wait_status)) {
    RemovePartialOutput(request.output_path);
    error = options_.executable + " ended with signal " +
            std::to_string(WTERMSIG(outcome.wait_status));
    return false;
  }
  const int exit_code = WIFEXITED(outcome.wait_status) ? WEXITSTATUS(outcome.wait_status) : -1;
  if (exit_code != 0) {
    RemovePartialOutput(request.output_path);
    error = options_.executable + " exited with status " + std::to_string(exit_code);
    if (exit_code == 127) {
      error += " (command not found?)";
    }
    if (!result.tool_output.empty()) {
      logger_.Error("capture command output", {{"output", result.tool_output}});
    }
    return false;
  }

  std::error_code ec;
  if (!fs::is_regular_file(request.output_path, ec) || ec) {
    error = options_.executable + " reported success but wrote no file at " +
            request.output_path.string();
    return false;
  }

  if (!result.tool_output.empty()) {
    logger_.Debug("capture command output", {{"output", result.tool_output}});
  }
  result.artifact_path = request.output_path;
  return true;
}

} // namespace cosmicam::camera
