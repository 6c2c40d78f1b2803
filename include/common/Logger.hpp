#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rfc2136::common {

/// Process-wide "rfc2136" logger on stderr; stdout is left to the CLI's
/// record listing. Installed as spdlog's default logger.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Applied {} of {} {} in zone {}", sMode, sName, sType, sZone);
class Logger {
 public:
  /// Create the logger, or change its level when it already exists.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off".
  /// Throws ValidationError on anything else.
  static void init(const std::string& sLevel);

  /// The shared logger; created at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

  static bool _bInitialized;
};

}  // namespace rfc2136::common
