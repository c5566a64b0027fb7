#include "api/attendance_handler.h"
#include "api/health_handler.h"
#include "api/recognition_handler.h"
#include "attendance/attendance_service.h"
#include "config/system_config.h"
#include "core/attendance_errors.h"
#include "core/cors_helper.h"
#include "core/env_config.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include "storage/file_attendance_storage.h"
#include <drogon/drogon.h>
#include <atomic>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Face Attendance API Server
 *
 * REST API server using Drogon framework. Matches face embeddings against
 * the identity gallery and keeps the daily attendance ledger.
 */

// Global logging flags (exported via logging_flags.h)
std::atomic<bool> g_log_api{false};
std::atomic<bool> g_log_recognition{false};
std::atomic<bool> g_log_attendance{false};

namespace {

struct CommandLine {
  std::string configPath;
};

/**
 * @brief Parse command line
 * @return false when the process should exit (help or bad option)
 */
bool parseArguments(int argc, char *argv[], CommandLine &options,
                    int &exit_code) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--log-api" || arg == "--debug-api") {
      g_log_api = true;
      std::cerr << "[Main] API logging enabled" << std::endl;
    } else if (arg == "--log-recognition") {
      g_log_recognition = true;
      std::cerr << "[Main] Recognition logging enabled" << std::endl;
    } else if (arg == "--log-attendance") {
      g_log_attendance = true;
      std::cerr << "[Main] Attendance logging enabled" << std::endl;
    } else if (arg == "--log-all") {
      g_log_api = true;
      g_log_recognition = true;
      g_log_attendance = true;
      std::cerr << "[Main] All logging categories enabled" << std::endl;
    } else if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "Option " << arg << " requires a path" << std::endl;
        exit_code = 1;
        return false;
      }
      options.configPath = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cerr << "Usage: " << argv[0] << " [OPTIONS]" << std::endl;
      std::cerr << "Options:" << std::endl;
      std::cerr << "  --config, -c <path>            Config file (default "
                   "CONFIG_FILE or ./config.json)"
                << std::endl;
      std::cerr << "  --log-api, --debug-api         Enable API "
                   "request/response logging"
                << std::endl;
      std::cerr << "  --log-recognition              Enable per-query "
                   "recognition logging"
                << std::endl;
      std::cerr << "  --log-attendance               Enable attendance ledger "
                   "logging"
                << std::endl;
      std::cerr << "  --log-all                      Enable every logging "
                   "category"
                << std::endl;
      std::cerr << "  --help, -h                     Show this help message"
                << std::endl;
      exit_code = 0;
      return false;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      std::cerr << "Use --help for usage information" << std::endl;
      exit_code = 1;
      return false;
    }
  }
  return true;
}

drogon::LogLevel toDrogonLevel(plog::Severity severity) {
  switch (severity) {
  case plog::verbose:
    return trantor::Logger::kTrace;
  case plog::debug:
    return trantor::Logger::kDebug;
  case plog::info:
    return trantor::Logger::kInfo;
  case plog::warning:
    return trantor::Logger::kWarn;
  default:
    return trantor::Logger::kError;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine options;
  int exit_code = 0;
  if (!parseArguments(argc, argv, options, exit_code)) {
    return exit_code;
  }

  if (options.configPath.empty()) {
    options.configPath = EnvConfig::getString("CONFIG_FILE", "./config.json");
  }

  SystemConfig config;
  if (!config.loadConfig(options.configPath)) {
    std::cerr << "[Main] Cannot start: " << config.lastError() << std::endl;
    return 1;
  }
  if (!config.applyEnvironmentOverrides()) {
    std::cerr << "[Main] Cannot start: " << config.lastError() << std::endl;
    return 1;
  }

  auto loggingConfig = config.getLoggingConfig();
  plog::Severity severity = plog::info;
  Logger::parseSeverity(loggingConfig.logLevel, severity);
  Logger::init(loggingConfig.logDir, severity, loggingConfig.maxLogFiles);

  PLOG_INFO << "========================================";
  PLOG_INFO << "Face Attendance API Server";
  PLOG_INFO << "========================================";
  PLOG_INFO << "Config file: " << config.getConfigPath();
  if (g_log_api.load()) {
    PLOG_INFO << "API logging: ENABLED";
  }
  if (g_log_recognition.load()) {
    PLOG_INFO << "Recognition logging: ENABLED";
  }
  if (g_log_attendance.load()) {
    PLOG_INFO << "Attendance logging: ENABLED";
  }

  auto storageConfig = config.getStorageConfig();
  std::string dataDir = EnvConfig::resolveDirectory(storageConfig.dataDir, "data");

  AttendanceServiceOptions serviceOptions;
  serviceOptions.recognition = config.getRecognitionConfig();
  serviceOptions.attendance = config.getAttendanceConfig();
  serviceOptions.backupRoot =
      (std::filesystem::path(dataDir) / "backups").string();

  std::unique_ptr<AttendanceService> service;
  try {
    auto storage = std::make_unique<FileAttendanceStorage>(
        dataDir, storageConfig.galleryFile, storageConfig.attendanceDir);
    service = std::make_unique<AttendanceService>(serviceOptions,
                                                  std::move(storage));
  } catch (const AttendanceError &e) {
    PLOG_FATAL << "[Main] Failed to initialize attendance service ("
               << errorKindToString(e.kind()) << "): " << e.what();
    return 1;
  } catch (const std::invalid_argument &e) {
    PLOG_FATAL << "[Main] Failed to initialize attendance service: "
               << e.what();
    return 1;
  }

  RecognitionHandler::setAttendanceService(service.get());
  AttendanceHandler::setAttendanceService(service.get());
  HealthHandler::setAttendanceService(service.get());

  auto webServer = config.getWebServerConfig();
  CorsHelper::setEnabled(webServer.corsEnabled);

  try {
    auto &app = drogon::app();
    app.setLogLevel(toDrogonLevel(severity))
        .setThreadNum(webServer.threads)
        .addListener(webServer.ipAddress, webServer.port);

    PLOG_INFO << "[Server] Starting HTTP server on " << webServer.ipAddress
              << ":" << webServer.port << " with " << webServer.threads
              << " thread(s)";
    app.run();
  } catch (const std::exception &e) {
    PLOG_FATAL << "[Server] Fatal error: " << e.what();
    RecognitionHandler::setAttendanceService(nullptr);
    AttendanceHandler::setAttendanceService(nullptr);
    HealthHandler::setAttendanceService(nullptr);
    return 1;
  }

  PLOG_INFO << "[Server] Shut down";
  RecognitionHandler::setAttendanceService(nullptr);
  AttendanceHandler::setAttendanceService(nullptr);
  HealthHandler::setAttendanceService(nullptr);
  return 0;
}
