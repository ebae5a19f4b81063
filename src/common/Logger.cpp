#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sso::common {

namespace {
constexpr const char* kLoggerName = "sso";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);

  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::get(kLoggerName);
  if (!spLogger) {
    spLogger = spdlog::stdout_color_mt(kLoggerName);
  }
  spLogger->set_pattern(kPattern);
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

void Logger::shutdown() {
  if (!_bInitialized) return;
  spdlog::default_logger()->flush();
  spdlog::drop_all();
  spdlog::shutdown();
  _bInitialized = false;
}

}  // namespace sso::common
