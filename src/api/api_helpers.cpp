#include "api/api_helpers.h"
#include "core/cors_helper.h"
#include <drogon/utils/Utilities.h>
#include <memory>

using namespace drogon;

namespace ApiHelpers {

HttpResponsePtr createSuccessResponse(const Json::Value &data, int statusCode) {
  auto resp = HttpResponse::newHttpJsonResponse(data);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  CorsHelper::addAllowAllHeaders(resp);
  return resp;
}

HttpResponsePtr createErrorResponse(int statusCode, const std::string &error,
                                    const std::string &message) {
  Json::Value response(Json::objectValue);
  response["error"] = error;
  if (!message.empty()) {
    response["message"] = message;
  }

  auto resp = HttpResponse::newHttpJsonResponse(response);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  CorsHelper::addAllowAllHeaders(resp);
  return resp;
}

int statusCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::DimensionMismatch:
  case ErrorKind::ValidationError:
  case ErrorKind::InvalidArgument:
    return 400;
  case ErrorKind::PersistenceFailure:
  case ErrorKind::None:
  default:
    return 500;
  }
}

HttpResponsePtr createErrorResponse(ErrorKind kind, const std::string &message) {
  int status = statusCodeFor(kind);
  Json::Value response(Json::objectValue);
  response["error"] = status == 400 ? "Invalid request" : "Internal server error";
  response["kind"] = errorKindToString(kind);
  response["message"] = message;
  return createSuccessResponse(response, status);
}

bool parseJsonBody(const HttpRequestPtr &req, Json::Value &body,
                   std::string &error) {
  auto json = req->getJsonObject();
  if (json) {
    body = *json;
  } else {
    std::string raw(req->body());
    if (raw.empty()) {
      error = "Request body must be valid JSON";
      return false;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &body, &errors)) {
      error = "Request body must be valid JSON: " + errors;
      return false;
    }
  }
  if (!body.isObject()) {
    error = "Request body must be a JSON object";
    return false;
  }
  return true;
}

std::string extractPathParam(const HttpRequestPtr &req,
                             const std::string &prefix) {
  std::string path = req->getPath();
  size_t pos = path.find(prefix);
  if (pos == std::string::npos) {
    return "";
  }
  size_t start = pos + prefix.length();
  size_t end = path.find('/', start);
  if (end == std::string::npos) {
    end = path.length();
  }
  return drogon::utils::urlDecode(path.substr(start, end - start));
}

std::optional<CalendarDate> dateParam(const HttpRequestPtr &req,
                                      const std::string &name,
                                      const CalendarDate &fallback,
                                      std::string &error) {
  std::string text = req->getParameter(name);
  if (text.empty()) {
    return fallback;
  }
  auto date = CalendarDate::parse(text);
  if (!date) {
    error = "Invalid " + name + " date '" + text + "', expected YYYY-MM-DD";
  }
  return date;
}

long long elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace ApiHelpers
