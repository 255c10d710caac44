#ifndef LOGGING_HPP
#define LOGGING_HPP

#include "config.hpp"

/**
 * @enum LogTarget
 * @brief Where diagnostic output may go besides the optional log file
 *
 * - Terminal: the program owns stderr (non-interactive front end)
 * - FileOnly: the terminal belongs to the UI; without LOG_FILE nothing is
 *   logged
 */
enum class LogTarget { Terminal, FileOnly };

/**
 * @brief Installs the default spdlog logger for this process
 *
 * Sinks: a file sink when Config::log_file is set, plus a stderr sink for
 * LogTarget::Terminal. With no sink left, a null sink is installed so that
 * library code can log unconditionally.
 *
 * @param config Finalized or unfinalized configuration (log_file, log_level)
 * @param target Terminal availability
 *
 * @throws ConfigError for an unknown log level or an unwritable log file
 */
void setupLogging(const Config &config, LogTarget target);

#endif // LOGGING_HPP
