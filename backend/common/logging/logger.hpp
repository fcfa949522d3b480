#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace common {

class Logger {
public:
  static constexpr const char* kLoggerName = "media_relay";

  enum class Level {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR
  };

  // Accepts TRACE, DEBUG, INFO, WARN or ERROR; anything else falls back to INFO.
  static void init(const std::string& log_level = "INFO");

  static void trace(const std::string& message) { log(Level::TRACE, message); }
  static void debug(const std::string& message) { log(Level::DEBUG, message); }
  static void info(const std::string& message) { log(Level::INFO, message); }
  static void warn(const std::string& message) { log(Level::WARN, message); }
  static void error(const std::string& message) { log(Level::ERROR, message); }

private:
  static std::shared_ptr<spdlog::logger> getLogger();
  static void log(Level level, const std::string& message);
};

}
