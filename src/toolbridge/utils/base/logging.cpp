#include "logging.hpp"

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string>

namespace toolbridge::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::mutex padlock;

/// @private
static const char* const k_pattern = "[%Y-%m-%d %T] [%^%l%$] %v";

/// @private
static void apply_level(spdlog::logger& logger) {
#ifdef DEBUG_BUILD
  logger.set_level(spdlog::level::trace);
#else
  logger.set_level(spdlog::level::warn);
#endif

  const char* env_variable = "LOG_LEVEL_OVERRIDE";
  const char* log_level = std::getenv(env_variable);
  if (log_level) {
    const auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != std::string_view{"off"}) {
      logger.error("failed to set log level from environment variable {}={}", env_variable,
                   log_level);
    } else {
      logger.set_level(level);
    }
  }
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::lock_guard lock{padlock};
  if (!instance) {
    instance = spdlog::stderr_color_mt("toolbridge");
    instance->set_pattern(k_pattern);
    apply_level(*instance);
  }
  assert(instance);
  return *instance;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
  assert(logger);
  std::lock_guard lock{padlock};
  instance = std::move(logger);
}

bool init_file_logger(std::string_view filename) {
  std::shared_ptr<spdlog::logger> logger;
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{filename}, true);
    logger = std::make_shared<spdlog::logger>("toolbridge-file", std::move(sink));
  } catch (const spdlog::spdlog_ex& e) {
    debug_logger().error("failed to open log file '{}': {}", filename, e.what());
    return false;
  }
  logger->set_pattern(k_pattern);
  logger->flush_on(spdlog::level::info);
  apply_level(*logger);
  set_logger(std::move(logger));
  return true;
}

} // namespace toolbridge::logging
