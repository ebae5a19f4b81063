#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sso::common {

/// Process-wide spdlog logger named "sso".
/// Registered as spdlog's default logger so that it outlives every component.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Listening on port {}", iPort);
class Logger {
 public:
  /// Create the logger on first call; later calls only change the level.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns the logger, initializing it at "info" if init() was never called.
  static std::shared_ptr<spdlog::logger> get();

  /// Flush and drop all spdlog loggers. Safe to call more than once.
  static void shutdown();

 private:
  static bool _bInitialized;
};

}  // namespace sso::common
