#pragma once

/**
 * @file logger.hpp
 * @brief Centralized logging facade using spdlog
 */

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace modelcheck::core {

// A named logger sharing the sinks created by Logger::init().
class LogCategory {
public:
  explicit LogCategory(const char *name) : m_name(name) {}

  const char *name() const { return m_name; }

  template <typename... Args>
  void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->error(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) const {
    if (m_logger)
      m_logger->critical(fmt, std::forward<Args>(args)...);
  }

private:
  friend class Logger;

  const char *m_name;
  std::shared_ptr<spdlog::logger> m_logger;
};

class Logger {
public:
  // Static-only interface
  Logger() = delete;
  ~Logger() = delete;
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Initialize logger (call once on startup)
  static void init(const std::string &pattern = "[%H:%M:%S] [%n] [%l] %v");
  static void shutdown();

  static void setLevel(spdlog::level::level_enum level);

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger) {
      sLogger->critical(fmt, std::forward<Args>(args)...);
    }
  }

  static LogCategory Material;
  static LogCategory Shader;
  static LogCategory Validation;
  static LogCategory Folder;

private:
  static std::shared_ptr<spdlog::logger> sLogger;
};

} // namespace modelcheck::core
