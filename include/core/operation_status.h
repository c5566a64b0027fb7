#pragma once

#include "core/attendance_errors.h"
#include <string>
#include <utility>

/**
 * @brief Outcome tag carried by every result of the attendance service
 *
 * Expected outcomes (duplicate mark, unknown identity on remove) are
 * ordinary tags; only structural failures use Error.
 */
enum class OperationStatus { Success, AlreadyMarked, NotFound, Error };

inline std::string operationStatusToString(OperationStatus status) {
  switch (status) {
  case OperationStatus::Success:
    return "success";
  case OperationStatus::AlreadyMarked:
    return "already_marked";
  case OperationStatus::NotFound:
    return "not_found";
  case OperationStatus::Error:
    return "error";
  default:
    return "error";
  }
}

/**
 * @brief Tagged result: a status, the failure kind and message on Error,
 * and a value that is meaningful when status != Error
 */
template <typename T> struct OperationResult {
  OperationStatus status = OperationStatus::Success;
  ErrorKind errorKind = ErrorKind::None;
  std::string message;
  T value{};

  bool ok() const { return status != OperationStatus::Error; }

  static OperationResult success(T value) {
    OperationResult result;
    result.value = std::move(value);
    return result;
  }

  static OperationResult withStatus(OperationStatus status, T value,
                                    const std::string &message = "") {
    OperationResult result;
    result.status = status;
    result.value = std::move(value);
    result.message = message;
    return result;
  }

  static OperationResult failure(ErrorKind kind, const std::string &message) {
    OperationResult result;
    result.status = OperationStatus::Error;
    result.errorKind = kind;
    result.message = message;
    return result;
  }
};
