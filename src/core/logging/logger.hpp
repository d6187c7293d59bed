#pragma once

#include "core/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace cosmicam::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

namespace detail {

struct LevelName {
  std::string_view name;
  std::string_view label;
  LogLevel level;
};

inline constexpr std::array<LevelName, 4> kLevelNames = {{
    {"debug", "DEBUG", LogLevel::kDebug},
    {"info", "INFO", LogLevel::kInfo},
    {"warn", "WARN", LogLevel::kWarn},
    {"error", "ERROR", LogLevel::kError},
}};

} // namespace detail

inline const char* ToString(LogLevel level) {
  for (const auto& entry : detail::kLevelNames) {
    if (entry.level == level) {
      return entry.label.data();
    }
  }
  return "INFO";
}

// Accepts the lowercase names in any case, plus `warning`.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  std::string normalized;
  normalized.reserve(raw.size());
  for (const unsigned char c : raw) {
    normalized.push_back(static_cast<char>(std::tolower(c)));
  }
  if (normalized == "warning") {
    normalized = "warn";
  }

  for (const auto& entry : detail::kLevelNames) {
    if (entry.name == normalized) {
      level = entry.level;
      return true;
    }
  }

  error = "unknown log level '" + std::string(raw) + "' (expected debug|info|warn|error)";
  return false;
}

// Line-oriented key="value" logger shared by the capture loop, the settings
// store and the CLI:
//
//   ts_utc=2024-03-20T12:00:00.000Z level=INFO component="camera" msg="image captured"
//
// The loop thread and the signal-watch thread log through the same instance,
// so each line is assembled first and written in one locked call.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Tag for every following line (`camera`, `config`, `system`, `cli`).
  void SetComponent(std::string component) {
    std::lock_guard<std::mutex> lock(mu_);
    component_ = std::move(component);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::unique_lock<std::mutex> lock(mu_);
    if (level < min_level_) {
      return;
    }
    const std::string component = component_;
    lock.unlock();

    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "component", component);
    AppendField(line, "msg", message);
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    lock.lock();
    out_ << line;
    out_.flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  // Tool output and file paths end up in values, so every control byte is
  // escaped to keep one record per line.
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line += "=\"";
    for (const char c : value) {
      switch (c) {
      case '\\':
        line += "\\\\";
        break;
      case '"':
        line += "\\\"";
        break;
      case '\n':
        line += "\\n";
        break;
      case '\r':
        line += "\\r";
        break;
      case '\t':
        line += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20U) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\x%02x", static_cast<unsigned char>(c));
          line += escaped;
        } else {
          line.push_back(c);
        }
        break;
      }
    }
    line.push_back('"');
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream& out_;
  std::string component_ = "system";
};

} // namespace cosmicam::core::logging
