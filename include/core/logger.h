#pragma once

#include "core/env_config.h"
#include <algorithm>
#include <filesystem>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <string>

/**
 * @brief Logger utility with size-based log rotation using Plog
 *
 * Usage:
 *   Logger::init();  // Initialize with default settings
 *   PLOG_INFO << "Your log message";
 *   PLOG_ERROR << "Error message";
 */

namespace Logger {

/**
 * @brief Parse a severity name (NONE, FATAL, ERROR, WARN, INFO, DEBUG,
 * VERBOSE)
 * @return true if the name was recognised
 */
inline bool parseSeverity(const std::string &name, plog::Severity &out) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "NONE") out = plog::none;
  else if (upper == "FATAL") out = plog::fatal;
  else if (upper == "ERROR") out = plog::error;
  else if (upper == "WARNING" || upper == "WARN") out = plog::warning;
  else if (upper == "INFO") out = plog::info;
  else if (upper == "DEBUG") out = plog::debug;
  else if (upper == "VERBOSE") out = plog::verbose;
  else return false;
  return true;
}

/**
 * @brief Initialize Plog logger with a rolling file appender
 *
 * Creates log directory if it doesn't exist. Files roll by size:
 * log.txt, log.txt.1, log.txt.2, ...
 *
 * @param log_dir Directory to store log files (LOG_DIR overrides)
 * @param log_level Log level (LOG_LEVEL overrides)
 * @param max_files Maximum number of rolled files to keep (LOG_MAX_DAYS
 * overrides)
 * @param enable_console Whether to also log to console
 */
inline void init(const std::string &log_dir = "",
                 plog::Severity log_level = plog::info, int max_files = 7,
                 bool enable_console = true) {

  std::string log_directory = EnvConfig::getString(
      "LOG_DIR", log_dir.empty() ? std::string("./logs") : log_dir);

  max_files = EnvConfig::getInt("LOG_MAX_DAYS", max_files, 0, 365);

  try {
    std::filesystem::create_directories(log_directory);
  } catch (const std::exception &e) {
    std::cerr << "Warning: Failed to create log directory '" << log_directory
              << "': " << e.what() << std::endl;
    std::cerr << "Logs will be written to current directory." << std::endl;
    log_directory = ".";
  }

  std::string log_level_str = EnvConfig::getString("LOG_LEVEL", "");
  if (!log_level_str.empty() && !parseSeverity(log_level_str, log_level)) {
    std::cerr << "Warning: Invalid LOG_LEVEL='" << log_level_str
              << "', keeping " << plog::severityToString(log_level)
              << std::endl;
  }

  std::string log_file_path = log_directory;
  if (!log_directory.empty() && log_directory.back() != '/') {
    log_file_path += "/";
  }
  log_file_path += "log.txt";

  size_t max_file_size = 10 * 1024 * 1024; // 10MB

  static plog::RollingFileAppender<plog::TxtFormatter> rollingFileAppender(
      log_file_path.c_str(), max_file_size, max_files);

  if (enable_console) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(log_level, &consoleAppender).addAppender(&rollingFileAppender);
  } else {
    plog::init(log_level, &rollingFileAppender);
  }

  PLOG_INFO << "========================================";
  PLOG_INFO << "Logger initialized";
  PLOG_INFO << "Log file: " << log_file_path
            << " (will be: log.txt, log.txt.1, log.txt.2, ...)";
  PLOG_INFO << "Log level: " << plog::severityToString(log_level);
  PLOG_INFO << "Max files to keep: "
            << (max_files == 0 ? "unlimited" : std::to_string(max_files));
  PLOG_INFO << "Console logging: " << (enable_console ? "enabled" : "disabled");
  PLOG_INFO << "========================================";
}

} // namespace Logger
