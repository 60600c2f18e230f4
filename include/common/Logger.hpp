#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ferry::common {

/// Thin wrapper over spdlog for service logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::init("info", "/var/log/ferry/ferry.log");
///   Logger::get()->info("Session {} created", sToken);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// When sLogFile is non-empty, records are also appended to that file.
  static void init(const std::string& sLevel, const std::string& sLogFile = "");

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace ferry::common
