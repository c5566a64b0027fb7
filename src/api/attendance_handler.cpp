#include "api/attendance_handler.h"
#include "api/api_helpers.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include <chrono>

using ApiHelpers::createErrorResponse;
using ApiHelpers::createSuccessResponse;
using ApiHelpers::elapsedMs;

AttendanceService *AttendanceHandler::service_ = nullptr;

void AttendanceHandler::setAttendanceService(AttendanceService *service) {
  service_ = service;
}

Json::Value
AttendanceHandler::recordsToJson(const std::vector<AttendanceRecord> &records) {
  Json::Value list(Json::arrayValue);
  for (const auto &record : records) {
    list.append(record.toJson());
  }
  return list;
}

bool AttendanceHandler::parseRange(const HttpRequestPtr &req,
                                   CalendarDate &start, CalendarDate &end,
                                   std::string &error) {
  CalendarDate today = service_->today();
  auto parsedEnd = ApiHelpers::dateParam(req, "end", today, error);
  if (!parsedEnd) {
    return false;
  }
  auto parsedStart = ApiHelpers::dateParam(req, "start", *parsedEnd, error);
  if (!parsedStart) {
    return false;
  }
  start = *parsedStart;
  end = *parsedEnd;
  return true;
}

void AttendanceHandler::markAttendance(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/attendance/mark - Mark attendance";
    PLOG_DEBUG << "[API] Request from: " << req->getPeerAddr().toIpPort();
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    Json::Value body;
    std::string error;
    if (!ApiHelpers::parseJsonBody(req, body, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }
    if (!body.isMember("label") || !body["label"].isString()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Missing required field: label"));
      return;
    }

    std::optional<LocalDateTime> timestamp;
    if (body.isMember("timestamp") && !body["timestamp"].isNull()) {
      if (!body["timestamp"].isString()) {
        callback(createErrorResponse(400, "Invalid request",
                                     "Field 'timestamp' must be a string"));
        return;
      }
      timestamp = LocalDateTime::parse(body["timestamp"].asString());
      if (!timestamp) {
        callback(createErrorResponse(
            400, "Invalid request",
            "Invalid timestamp, expected YYYY-MM-DDTHH:MM:SS"));
        return;
      }
    }

    std::string label = body["label"].asString();
    auto result = service_->markAttendance(label, timestamp);
    if (!result.ok()) {
      if (isApiLoggingEnabled()) {
        PLOG_WARNING << "[API] POST /v1/attendance/mark - Error: "
                     << result.message;
      }
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/attendance/mark - "
                << operationStatusToString(result.status) << " for " << label
                << " - " << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(result.value.toJson()));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/attendance/mark - Exception: " << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::manualAttendance(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/attendance/manual - Manual entry";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    Json::Value body;
    std::string error;
    if (!ApiHelpers::parseJsonBody(req, body, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    for (const char *field : {"label", "date", "time"}) {
      if (!body.isMember(field) || !body[field].isString()) {
        callback(createErrorResponse(400, "Invalid request",
                                     std::string("Missing required field: ") +
                                         field));
        return;
      }
    }

    auto date = CalendarDate::parse(body["date"].asString());
    if (!date) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Invalid date, expected YYYY-MM-DD"));
      return;
    }
    auto time = TimeOfDay::parse(body["time"].asString());
    if (!time) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Invalid time, expected HH:MM[:SS]"));
      return;
    }
    std::string status = AttendanceRecord::kStatusPresent;
    if (body.isMember("status")) {
      if (!body["status"].isString()) {
        callback(createErrorResponse(400, "Invalid request",
                                     "Field 'status' must be a string"));
        return;
      }
      status = body["status"].asString();
    }

    auto result = service_->manualAttendance(body["label"].asString(), *date,
                                             *time, status);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["status"] = "success";
    response["record"] = result.value.toJson();

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/attendance/manual - Success: "
                << result.value.label << " on " << date->toString() << " - "
                << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response, 201));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/attendance/manual - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::getToday(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/today";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    auto result = service_->todayAttendance();
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["date"] = service_->today().toString();
    response["records"] = recordsToJson(result.value);
    response["count"] = static_cast<Json::UInt64>(result.value.size());
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::getHistory(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  std::string label = ApiHelpers::extractPathParam(req, "/history/");

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/history/" << label;
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }
    if (label.empty()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Identity label is required"));
      return;
    }

    std::optional<int> days;
    std::string daysParam = req->getParameter("days");
    if (!daysParam.empty()) {
      try {
        size_t consumed = 0;
        int value = std::stoi(daysParam, &consumed);
        if (consumed != daysParam.size()) {
          throw std::invalid_argument(daysParam);
        }
        days = value;
      } catch (const std::logic_error &) {
        callback(createErrorResponse(400, "Invalid request",
                                     "Query parameter 'days' must be an "
                                     "integer"));
        return;
      }
    }

    auto result = service_->history(label, days);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["label"] = label;
    response["records"] = recordsToJson(result.value);
    response["count"] = static_cast<Json::UInt64>(result.value.size());
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::getReport(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/report";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    CalendarDate start, end;
    std::string error;
    if (!parseRange(req, start, end, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    auto result = service_->getReport(start, end);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["start"] = start.toString();
    response["end"] = end.toString();
    response["records"] = recordsToJson(result.value);
    response["count"] = static_cast<Json::UInt64>(result.value.size());

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] GET /v1/attendance/report - " << result.value.size()
                << " record(s) - " << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::getStatistics(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/statistics";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    CalendarDate start, end;
    std::string error;
    if (!parseRange(req, start, end, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    auto result = service_->getStatistics(start, end);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }
    callback(createSuccessResponse(result.value.toJson()));

  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::exportCsv(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/export";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    CalendarDate start, end;
    std::string error;
    if (!parseRange(req, start, end, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    auto result = service_->exportCsv(start, end);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(k200OK);
    resp->setContentTypeCode(CT_CUSTOM);
    resp->addHeader("Content-Type", "text/csv; charset=utf-8");
    resp->addHeader("Content-Disposition",
                    "attachment; filename=\"attendance_" + start.toString() +
                        "_to_" + end.toString() + ".csv\"");
    resp->setBody(result.value);
    CorsHelper::addAllowAllHeaders(resp);
    callback(resp);

  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::getSession(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/attendance/session";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }
    callback(createSuccessResponse(service_->sessionStatistics().toJson()));
  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::backup(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/attendance/backup";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    std::optional<std::string> name;
    if (!std::string(req->body()).empty()) {
      Json::Value body;
      std::string error;
      if (!ApiHelpers::parseJsonBody(req, body, error)) {
        callback(createErrorResponse(400, "Invalid request", error));
        return;
      }
      if (body.isMember("name")) {
        if (!body["name"].isString()) {
          callback(createErrorResponse(400, "Invalid request",
                                       "Field 'name' must be a string"));
          return;
        }
        name = body["name"].asString();
      }
    }

    auto result = service_->backup(name);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["backup_path"] = result.value.path;
    response["files_backed_up"] =
        static_cast<Json::UInt64>(result.value.filesCopied);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/attendance/backup - Success: "
                << result.value.path << " - " << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response, 201));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/attendance/backup - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void AttendanceHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(CorsHelper::createOptionsResponse());
}
