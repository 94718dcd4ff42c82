#include "modelcheck/core/logger.hpp"

namespace modelcheck::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

LogCategory Logger::Material("Material");
LogCategory Logger::Shader("Shader");
LogCategory Logger::Validation("Validation");
LogCategory Logger::Folder("Folder");

static LogCategory *categories[] = {&Logger::Material, &Logger::Shader,
                                    &Logger::Validation, &Logger::Folder};

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger =
      std::make_shared<spdlog::logger>("modelcheck", consoleSink);

  for (LogCategory *category : categories) {
    category->m_logger =
        std::make_shared<spdlog::logger>(category->name(), consoleSink);
  }

  sLogger = logger;

  setLevel(
#ifdef DEBUG
      spdlog::level::debug
#else
      spdlog::level::info
#endif
  );

  for (LogCategory *category : categories) {
    category->m_logger->set_pattern(pattern);
  }
  sLogger->set_pattern(pattern);

  info("Logger initialized");
}

void Logger::shutdown() {
  for (LogCategory *category : categories) {
    category->m_logger.reset();
  }
  sLogger.reset();
  spdlog::shutdown();
}

void Logger::setLevel(spdlog::level::level_enum level) {
  if (sLogger) {
    sLogger->set_level(level);
  }
  for (LogCategory *category : categories) {
    if (category->m_logger) {
      category->m_logger->set_level(level);
    }
  }
}

} // namespace modelcheck::core
