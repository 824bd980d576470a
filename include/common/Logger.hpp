#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sessiondb::common {

/// Process-wide "sessiondb" logger, installed as spdlog's default logger.
///
/// The pool, repository and sweeper log through get(); the sweeper calls it
/// from its own thread, so first-use initialization is synchronized.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->debug("Saved session {}", sId);
class Logger {
 public:
  /// Create the logger on first call, set the level on every call.
  /// Throws ConfigurationError for a level spdlog does not know.
  static void init(const std::string& sLevel);

  /// The shared logger. Created at "info" when init() was never called.
  static std::shared_ptr<spdlog::logger> get();

  /// "trace", "debug", "info", "warn", "error", "critical" or "off".
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);
};

}  // namespace sessiondb::common
