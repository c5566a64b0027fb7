#pragma once

#include <atomic>

/**
 * @brief Global logging flags for controlling different types of logging
 *
 * These flags are set via command-line arguments and can be checked
 * throughout the codebase to enable/disable specific logging features.
 */

// Forward declarations - actual definitions are in src/main.cpp
extern std::atomic<bool> g_log_api;
extern std::atomic<bool> g_log_recognition;
extern std::atomic<bool> g_log_attendance;

/**
 * @brief Check if API logging is enabled
 */
inline bool isApiLoggingEnabled() { return g_log_api.load(); }

/**
 * @brief Check if per-query recognition logging is enabled
 */
inline bool isRecognitionLoggingEnabled() { return g_log_recognition.load(); }

/**
 * @brief Check if attendance ledger logging is enabled
 *
 * Covers marks, duplicate attempts, manual entries and partition loads.
 */
inline bool isAttendanceLoggingEnabled() { return g_log_attendance.load(); }
