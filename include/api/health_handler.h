#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <chrono>
#include <string>

using namespace drogon;

class AttendanceService;

/**
 * @brief Health check endpoint handler
 *
 * Endpoint: GET /v1/core/health
 * Returns: JSON with status, timestamp, uptime and per-component checks.
 * "degraded" (still 200) when the gallery fails its integrity check,
 * "unhealthy" (503) when no service is attached.
 */
class HealthHandler : public drogon::HttpController<HealthHandler>
{
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(HealthHandler::getHealth, "/v1/core/health", Get);
    METHOD_LIST_END

    /**
     * @brief Handle GET /v1/core/health
     *
     * @param req HTTP request
     * @param callback Response callback
     */
    void getHealth(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    static void setAttendanceService(AttendanceService *service);

private:
    static AttendanceService *service_;

    /**
     * @brief Get current timestamp in ISO 8601 format
     */
    std::string getCurrentTimestamp() const;

    /**
     * @brief Get process uptime in seconds
     */
    int64_t getUptime() const;
};
