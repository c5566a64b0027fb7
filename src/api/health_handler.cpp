#include "api/health_handler.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include <chrono>
#include <ctime>
#include <drogon/HttpResponse.h>
#include <iomanip>
#include <json/json.h>
#include <sstream>

// Static start time for uptime calculation
static std::chrono::steady_clock::time_point g_start_time =
    std::chrono::steady_clock::now();

AttendanceService *HealthHandler::service_ = nullptr;

void HealthHandler::setAttendanceService(AttendanceService *service) {
  service_ = service;
}

void HealthHandler::getHealth(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  try {
    Json::Value response;
    std::string status = "healthy";
    Json::Value checks;

    int64_t uptime = getUptime();
    checks["uptime"] = uptime >= 0;

    checks["service"] = service_ != nullptr;
    if (!service_) {
      status = "unhealthy";
    } else {
      auto report = service_->validateGallery();
      checks["gallery"] = report.valid;
      if (!report.valid) {
        status = "degraded";
      }
      response["registered_identities"] =
          static_cast<Json::UInt64>(report.uniqueIdentities);
      response["total_embeddings"] =
          static_cast<Json::UInt64>(report.totalEmbeddings);
    }

    response["status"] = status;
    response["timestamp"] = getCurrentTimestamp();
    response["uptime"] = static_cast<Json::Int64>(uptime);
    response["service"] = "face_attendance_api";
    response["version"] = "1.0.0";
    response["checks"] = checks;

    auto resp = HttpResponse::newHttpJsonResponse(response);

    if (status == "unhealthy") {
      resp->setStatusCode(k503ServiceUnavailable);
    } else {
      resp->setStatusCode(k200OK);
    }

    CorsHelper::addAllowAllHeaders(resp);
    callback(resp);
  } catch (const std::exception &e) {
    Json::Value errorResponse;
    errorResponse["error"] = "Internal server error";
    errorResponse["message"] = e.what();

    auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
    resp->setStatusCode(k500InternalServerError);
    callback(resp);
  }
}

std::string HealthHandler::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << "Z";

  return ss.str();
}

int64_t HealthHandler::getUptime() const {
  auto now = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::seconds>(now - g_start_time);
  return duration.count();
}
