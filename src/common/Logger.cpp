#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace sessiondb::common {

namespace {

constexpr const char* kLoggerName = "sessiondb";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::once_flag g_onceCreate;

void createDefaultLogger() {
  auto spLogger = spdlog::stdout_color_mt(kLoggerName);
  spLogger->set_pattern(kPattern);
  spLogger->set_level(spdlog::level::info);
  spdlog::set_default_logger(std::move(spLogger));
}

}  // namespace

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  // from_str maps unknown names to "off", which would silence the store
  if (level == spdlog::level::off && sLevel != "off") {
    throw ConfigurationError("invalid_configuration", "Unknown log level: '" + sLevel + "'");
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);
  std::call_once(g_onceCreate, createDefaultLogger);
  spdlog::default_logger()->set_level(level);
  spdlog::default_logger()->debug("Log level set to '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  std::call_once(g_onceCreate, createDefaultLogger);
  return spdlog::default_logger();
}

}  // namespace sessiondb::common
