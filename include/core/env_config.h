#pragma once

#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Helper functions to parse environment variables
 *
 * Provides utilities to read and parse environment variables
 * with default values and validation.
 */
namespace EnvConfig {

/**
 * @brief Get string environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @return String value or default
 */
inline std::string getString(const char *name,
                             const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return value ? std::string(value) : default_value;
}

/**
 * @brief Get integer environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @param min_value Minimum allowed value (optional)
 * @param max_value Maximum allowed value (optional)
 * @return Integer value or default
 */
inline int getInt(const char *name, int default_value,
                  int min_value = INT32_MIN, int max_value = INT32_MAX) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    int int_value = std::stoi(value);
    if (int_value < min_value || int_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return int_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

/**
 * @brief Get double environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @param min_value Minimum allowed value (optional)
 * @param max_value Maximum allowed value (optional)
 * @return Double value or default
 */
inline double getDouble(const char *name, double default_value,
                        double min_value = -1e10, double max_value = 1e10) {
  const char *value = std::getenv(name);
  if (!value) {
    return default_value;
  }

  try {
    double double_value = std::stod(value);
    if (std::isnan(double_value) || double_value < min_value ||
        double_value > max_value) {
      std::cerr << "Warning: " << name << "=" << value << " is out of range ["
                << min_value << ", " << max_value
                << "]. Using default: " << default_value << std::endl;
      return default_value;
    }
    return double_value;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Invalid " << name << "='" << value
              << "': " << e.what() << ". Using default: " << default_value
              << std::endl;
    return default_value;
  }
}

/**
 * @brief Try to create a directory, returning true if it exists afterwards
 */
inline bool tryCreateDirectory(const std::string &path) {
  try {
    std::filesystem::create_directories(path);
    return std::filesystem::is_directory(path);
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "[EnvConfig] ⚠ Cannot create " << path << ": " << e.what()
              << std::endl;
    return false;
  }
}

/**
 * @brief Resolve directory path with 3-tier fallback strategy
 *
 * 1. Try to create preferred_path
 * 2. If that fails, fallback to user directory
 *    (~/.local/share/face_attendance_api/{subdir})
 * 3. If that fails, fallback to current directory (./{subdir})
 *
 * Never throws exceptions - always returns a path (even if creation failed)
 *
 * @param preferred_path Preferred directory path (e.g.,
 * "/opt/face_attendance_api/data")
 * @param subdir Subdirectory name for fallback (e.g., "data")
 * @return Resolved directory path
 */
inline std::string resolveDirectory(const std::string &preferred_path,
                                    const std::string &subdir = "") {
  if (std::filesystem::is_directory(preferred_path)) {
    return preferred_path;
  }
  if (tryCreateDirectory(preferred_path)) {
    std::cerr << "[EnvConfig] ✓ Created directory: " << preferred_path
              << std::endl;
    return preferred_path;
  }
  if (subdir.empty()) {
    return preferred_path;
  }

  const char *home = std::getenv("HOME");
  if (home && strlen(home) > 0) {
    std::string fallback =
        std::string(home) + "/.local/share/face_attendance_api/" + subdir;
    if (tryCreateDirectory(fallback)) {
      std::cerr << "[EnvConfig] ✓ Using fallback: " << fallback << std::endl;
      return fallback;
    }
  }

  std::string last_resort = "./" + subdir;
  if (tryCreateDirectory(last_resort)) {
    std::cerr << "[EnvConfig] ✓ Using last resort: " << last_resort
              << std::endl;
  } else {
    std::cerr << "[EnvConfig] ⚠⚠ Warning: Cannot create last resort "
                 "directory: "
              << last_resort << std::endl;
  }
  return last_resort;
}

} // namespace EnvConfig
