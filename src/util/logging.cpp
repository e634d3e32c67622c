#include "poz/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace poz::util {

namespace {

// Logger setup for the poznote client
class PozLogger {
public:
  static PozLogger& instance() {
    static PozLogger instance_;
    return instance_;
  }

  void initialize() {
    if (initialized_) return;

    try {
      // stdout carries note URLs for pipelines, diagnostics stay on stderr
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      auto logger = std::make_shared<spdlog::logger>("poznote", console_sink);

      logger->set_pattern("[%H:%M:%S.%e] [%l] %v");
      logger->set_level(spdlog::level::warn);

      spdlog::set_default_logger(logger);
      initialized_ = true;

    } catch (const spdlog::spdlog_ex& e) {
      // Keep spdlog's built-in default logger
      spdlog::set_pattern("[%l] %v");
      spdlog::warn("Failed to setup logging: {}", e.what());
    }
  }

  void setVerbosity(int verbosity) {
    if (verbosity >= 2) {
      spdlog::set_level(spdlog::level::debug);
    } else if (verbosity == 1) {
      spdlog::set_level(spdlog::level::info);
    } else {
      spdlog::set_level(spdlog::level::warn);
    }
  }

private:
  bool initialized_ = false;
};

} // namespace

void setupLogging(int verbosity) {
  auto& logger = PozLogger::instance();
  logger.initialize();
  logger.setVerbosity(verbosity);
}

} // namespace poz::util
