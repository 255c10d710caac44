#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void setupLogging(const Config &config, LogTarget target) {
  auto level = spdlog::level::from_str(config.log_level);
  if (level == spdlog::level::off && config.log_level != "off") {
    throw ConfigError("Unknown LOG_LEVEL '" + config.log_level + "'");
  }

  std::vector<spdlog::sink_ptr> sinks;

  if (!config.log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          config.log_file, false));
    } catch (const spdlog::spdlog_ex &e) {
      throw ConfigError("Cannot open log file " + config.log_file + ": " +
                        e.what());
    }
  }

  if (target == LogTarget::Terminal) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }

  auto logger =
      std::make_shared<spdlog::logger>("filetree", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("%H:%M:%S %^%l%$ | %v");
  spdlog::set_default_logger(logger);
}
