/**
 * @file logging.hpp
 * @brief spdlog-backed logging, compiled out unless ENABLE_LOGGING is set
 *
 * Key material (CEKs, KEKs, passwords, shared secrets) is never passed to
 * these macros. Decryption failure reasons are logged at debug level only.
 */

#pragma once

#include <string_view>

namespace jose {
namespace logging {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

/**
 * @brief Map a level name ("trace" ... "off") to a LogLevel, INFO when the
 * name is not recognised
 */
constexpr LogLevel parseLogLevel(std::string_view name) noexcept {
  if (name == "trace") return LogLevel::TRACE;
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "warn") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  if (name == "critical") return LogLevel::CRITICAL;
  if (name == "off") return LogLevel::OFF;
  return LogLevel::INFO;
}

}  // namespace logging
}  // namespace jose

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace jose {
namespace logging {

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) { logger_->set_level(toSpdlog(level)); }

  void setLogLevel(const std::string& level_str) {
    setLevel(parseLogLevel(level_str));
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

 private:
  Logger() {
    logger_ = spdlog::get("jose");
    if (!logger_) {
      logger_ = spdlog::stderr_color_mt("jose");
    }
    logger_->set_level(spdlog::level::warn);
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::info;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace jose

#define JOSE_LOG_TRACE(...) \
  jose::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define JOSE_LOG_DEBUG(...) \
  jose::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define JOSE_LOG_INFO(...) \
  jose::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define JOSE_LOG_WARN(...) \
  jose::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define JOSE_LOG_ERROR(...) \
  jose::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define JOSE_LOG_CRITICAL(...) \
  jose::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
#include <string>

#define JOSE_LOG_TRACE(...)
#define JOSE_LOG_DEBUG(...)
#define JOSE_LOG_INFO(...)
#define JOSE_LOG_WARN(...)
#define JOSE_LOG_ERROR(...)
#define JOSE_LOG_CRITICAL(...)

namespace jose {
namespace logging {
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(const std::string&) {}
};
}  // namespace logging
}  // namespace jose

#endif
