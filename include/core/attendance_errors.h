#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Failure categories reported by the gallery, ledger and storage
 */
enum class ErrorKind { None, DimensionMismatch, PersistenceFailure, ValidationError, InvalidArgument };

inline std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::DimensionMismatch:
    return "dimension_mismatch";
  case ErrorKind::PersistenceFailure:
    return "persistence_failure";
  case ErrorKind::ValidationError:
    return "validation_error";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  default:
    return "unknown";
  }
}

/**
 * @brief Base class for structural failures of the attendance core
 */
class AttendanceError : public std::runtime_error {
public:
  AttendanceError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/**
 * @brief Vector length differs from the configured embedding dimension
 */
class DimensionMismatchError : public AttendanceError {
public:
  DimensionMismatchError(size_t expected, size_t actual,
                         const std::string &context = "")
      : AttendanceError(ErrorKind::DimensionMismatch,
                        "Embedding dimension mismatch" +
                            (context.empty() ? std::string()
                                             : " (" + context + ")") +
                            ": expected " + std::to_string(expected) +
                            ", got " + std::to_string(actual)),
        expected_(expected), actual_(actual) {}

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

private:
  size_t expected_;
  size_t actual_;
};

/**
 * @brief Storage collaborator failed a load, save or append
 */
class PersistenceError : public AttendanceError {
public:
  explicit PersistenceError(const std::string &message)
      : AttendanceError(ErrorKind::PersistenceFailure, message) {}
};

/**
 * @brief Configuration or integrity check failure
 */
class ValidationError : public AttendanceError {
public:
  explicit ValidationError(const std::string &message)
      : AttendanceError(ErrorKind::ValidationError, message) {}
};
