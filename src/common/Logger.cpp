#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace rfc2136::common {

namespace {

constexpr const char* kLoggerName = "rfc2136";
std::mutex g_mtxInit;

}  // namespace

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  // from_str() maps unknown names to "off"
  const auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw ValidationError("Unknown log level '" + sLevel +
                          "' (expected trace, debug, info, warn, error, critical or off)");
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);

  std::lock_guard<std::mutex> lock(g_mtxInit);
  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::get(kLoggerName);
  if (!spLogger) {
    spLogger = spdlog::stderr_color_mt(kLoggerName);
  }
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(g_mtxInit);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("info");
  return spdlog::default_logger();
}

}  // namespace rfc2136::common
