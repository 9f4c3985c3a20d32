/**
 * @file logging.hpp
 * @brief Library logger; TC_LOG_* compile to nothing without ENABLE_LOGGING
 */

#pragma once

#include <initializer_list>
#include <string_view>

namespace trustchain {
namespace logging {

/**
 * @brief Level names accepted by TrustChainConfig::log_level
 */
inline bool isLevelName(std::string_view name) noexcept {
  for (std::string_view known : {"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}) {
    if (name == known) {
      return true;
    }
  }
  return false;
}

}  // namespace logging
}  // namespace trustchain

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace trustchain {
namespace logging {

/**
 * @brief The "trustchain" spdlog logger, writing to stderr
 *
 * Reuses a logger of that name if the application registered one first.
 */
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  spdlog::logger* get() const noexcept { return logger_.get(); }

  /// Unknown names leave the level unchanged
  void setLogLevel(std::string_view name) {
    if (!isLevelName(name)) {
      logger_->warn("Unknown log level '{}'", name);
      return;
    }
    logger_->set_level(spdlog::level::from_str(std::string(name)));
  }

 private:
  Logger() : logger_(spdlog::get("trustchain")) {
    if (!logger_) {
      logger_ = spdlog::stderr_color_mt("trustchain");
      logger_->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v");
    }
    logger_->set_level(spdlog::level::info);
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace trustchain

#define TC_LOG_AT(level, ...)                                              \
  SPDLOG_LOGGER_CALL(::trustchain::logging::Logger::getInstance().get(), \
                     level, __VA_ARGS__)

#define TC_LOG_TRACE(...) TC_LOG_AT(spdlog::level::trace, __VA_ARGS__)
#define TC_LOG_DEBUG(...) TC_LOG_AT(spdlog::level::debug, __VA_ARGS__)
#define TC_LOG_INFO(...) TC_LOG_AT(spdlog::level::info, __VA_ARGS__)
#define TC_LOG_WARN(...) TC_LOG_AT(spdlog::level::warn, __VA_ARGS__)
#define TC_LOG_ERROR(...) TC_LOG_AT(spdlog::level::err, __VA_ARGS__)

#else

#define TC_LOG_TRACE(...)
#define TC_LOG_DEBUG(...)
#define TC_LOG_INFO(...)
#define TC_LOG_WARN(...)
#define TC_LOG_ERROR(...)

namespace trustchain {
namespace logging {
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLogLevel(std::string_view) {}
};
}  // namespace logging
}  // namespace trustchain

#endif
