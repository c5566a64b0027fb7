#pragma once

#include "core/attendance_errors.h"
#include "models/calendar.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Response and request helpers shared by the REST handlers
 */
namespace ApiHelpers {

/**
 * @brief JSON response with CORS headers
 */
drogon::HttpResponsePtr createSuccessResponse(const Json::Value &data,
                                              int statusCode = 200);

/**
 * @brief {"error", "message"} response with CORS headers
 */
drogon::HttpResponsePtr createErrorResponse(int statusCode,
                                            const std::string &error,
                                            const std::string &message = "");

/**
 * @brief Error response for a failed service operation
 *
 * DimensionMismatch, ValidationError and InvalidArgument map to 400,
 * PersistenceFailure to 500.
 */
drogon::HttpResponsePtr createErrorResponse(ErrorKind kind,
                                            const std::string &message);

int statusCodeFor(ErrorKind kind);

/**
 * @brief Body as JSON, whatever the declared content type
 * @return false with error set when the body is missing or malformed
 */
bool parseJsonBody(const drogon::HttpRequestPtr &req, Json::Value &body,
                   std::string &error);

/**
 * @brief Path parameter value
 *
 * URL-decoded path segment following prefix (e.g. "/identities/").
 * Query parameters are never consulted.
 */
std::string extractPathParam(const drogon::HttpRequestPtr &req,
                             const std::string &prefix);

/**
 * @brief Query parameter parsed as "YYYY-MM-DD"
 * @return fallback when absent; nullopt with error set when malformed
 */
std::optional<CalendarDate> dateParam(const drogon::HttpRequestPtr &req,
                                      const std::string &name,
                                      const CalendarDate &fallback,
                                      std::string &error);

/**
 * @brief Milliseconds elapsed since start
 */
long long elapsedMs(std::chrono::steady_clock::time_point start);

} // namespace ApiHelpers
