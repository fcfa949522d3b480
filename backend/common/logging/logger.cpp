#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common {

void Logger::init(const std::string& log_level) {
  spdlog::level::level_enum level;
  if (log_level == "TRACE") {
    level = spdlog::level::trace;
  } else if (log_level == "DEBUG") {
    level = spdlog::level::debug;
  } else if (log_level == "INFO") {
    level = spdlog::level::info;
  } else if (log_level == "WARN") {
    level = spdlog::level::warn;
  } else if (log_level == "ERROR") {
    level = spdlog::level::err;
  } else {
    getLogger()->warn("Invalid log level: {}, defaulting to INFO", log_level);
    level = spdlog::level::info;
  }
  getLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::getLogger() {
  static auto logger = [] {
    auto existing = spdlog::get(kLoggerName);
    return existing ? existing : spdlog::stdout_color_mt(kLoggerName);
  }();
  return logger;
}

void Logger::log(Level level, const std::string& message) {
  auto logger = getLogger();
  switch (level) {
    case Level::TRACE:
      logger->trace(message);
      break;
    case Level::DEBUG:
      logger->debug(message);
      break;
    case Level::INFO:
      logger->info(message);
      break;
    case Level::WARN:
      logger->warn(message);
      break;
    case Level::ERROR:
      logger->error(message);
      break;
  }
}

}
