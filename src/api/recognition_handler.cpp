#include "api/recognition_handler.h"
#include "api/api_helpers.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include "core/logger.h"
#include "core/logging_flags.h"
#include <chrono>

using ApiHelpers::createErrorResponse;
using ApiHelpers::createSuccessResponse;
using ApiHelpers::elapsedMs;

AttendanceService *RecognitionHandler::service_ = nullptr;

void RecognitionHandler::setAttendanceService(AttendanceService *service) {
  service_ = service;
}

bool RecognitionHandler::parseEmbedding(const Json::Value &json,
                                        Embedding &embedding,
                                        std::string &error) {
  if (!json.isArray() || json.empty()) {
    error = "Embedding must be a non-empty array of numbers";
    return false;
  }
  embedding.clear();
  embedding.reserve(json.size());
  for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
    if (!json[i].isNumeric()) {
      error = "Embedding value at index " + std::to_string(i) +
              " is not a number";
      return false;
    }
    embedding.push_back(json[i].asFloat());
  }
  return true;
}

bool RecognitionHandler::parseTolerance(const Json::Value &body,
                                        std::optional<double> &tolerance,
                                        std::string &error) {
  if (!body.isMember("tolerance") || body["tolerance"].isNull()) {
    tolerance.reset();
    return true;
  }
  if (!body["tolerance"].isNumeric()) {
    error = "Field 'tolerance' must be a number";
    return false;
  }
  tolerance = body["tolerance"].asDouble();
  return true;
}

void RecognitionHandler::addIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/recognition/identities - Add identity";
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
    if (!body.isMember("embeddings") || !body["embeddings"].isArray()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Missing required field: embeddings"));
      return;
    }

    std::string label = body["label"].asString();
    std::vector<Embedding> embeddings;
    for (Json::ArrayIndex i = 0; i < body["embeddings"].size(); ++i) {
      Embedding embedding;
      if (!parseEmbedding(body["embeddings"][i], embedding, error)) {
        callback(createErrorResponse(400, "Invalid request",
                                     "embeddings[" + std::to_string(i) +
                                         "]: " + error));
        return;
      }
      embeddings.push_back(std::move(embedding));
    }

    auto result = service_->addIdentity(label, embeddings);
    if (!result.ok()) {
      if (isApiLoggingEnabled()) {
        PLOG_WARNING << "[API] POST /v1/recognition/identities - Error: "
                     << result.message << " - " << elapsedMs(start_time)
                     << "ms";
      }
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["label"] = label;
    response["added"] = static_cast<Json::UInt64>(result.value);
    response["total_embeddings"] =
        static_cast<Json::UInt64>(service_->galleryStatistics().totalEmbeddings);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/recognition/identities - Success: Added "
                << result.value << " embedding(s) for " << label << " - "
                << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response, 201));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/recognition/identities - Exception: "
                 << e.what() << " - " << elapsedMs(start_time) << "ms";
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::listIdentities(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/recognition/identities - List identities";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    Json::Value response = service_->galleryStatistics().toJson();

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] GET /v1/recognition/identities - Success: "
                << response["registered_identities"].asUInt64()
                << " identities - " << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] GET /v1/recognition/identities - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::removeIdentity(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();
  std::string label =
      ApiHelpers::extractPathParam(req, "/identities/");

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] DELETE /v1/recognition/identities/" << label
              << " - Remove identity";
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

    auto result = service_->removeIdentity(label);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["label"] = label;
    response["removed"] = static_cast<Json::UInt64>(result.value);
    response["status"] = operationStatusToString(result.status);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] DELETE /v1/recognition/identities/" << label
                << " - " << operationStatusToString(result.status) << ", "
                << result.value << " removed - " << elapsedMs(start_time)
                << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] DELETE /v1/recognition/identities/" << label
                 << " - Exception: " << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::recognize(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/recognition/recognize - Recognize embedding";
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

    Embedding embedding;
    if (!body.isMember("embedding")) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Missing required field: embedding"));
      return;
    }
    if (!parseEmbedding(body["embedding"], embedding, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }
    std::optional<double> tolerance;
    if (!parseTolerance(body, tolerance, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    auto result = service_->recognize(embedding, tolerance);
    if (!result.ok()) {
      if (isApiLoggingEnabled()) {
        PLOG_WARNING << "[API] POST /v1/recognition/recognize - Error: "
                     << result.message;
      }
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response = result.value.toJson();

    bool markAttendance = body.get("mark_attendance", false).asBool();
    if (markAttendance && result.value.matched) {
      auto mark = service_->markAttendance(result.value.label);
      if (!mark.ok()) {
        callback(createErrorResponse(mark.errorKind, mark.message));
        return;
      }
      response["attendance"] = mark.value.toJson();
    }

    if (isApiLoggingEnabled() || isRecognitionLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/recognition/recognize - Result: "
                << result.value.label << " (" << result.value.confidence
                << ") - " << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/recognition/recognize - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::recognizeBatch(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/recognition/recognize/batch - Batch recognize";
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
    if (!body.isMember("embeddings") || !body["embeddings"].isArray()) {
      callback(createErrorResponse(400, "Invalid request",
                                   "Missing required field: embeddings"));
      return;
    }

    std::vector<Embedding> embeddings;
    for (Json::ArrayIndex i = 0; i < body["embeddings"].size(); ++i) {
      Embedding embedding;
      if (!parseEmbedding(body["embeddings"][i], embedding, error)) {
        callback(createErrorResponse(400, "Invalid request",
                                     "embeddings[" + std::to_string(i) +
                                         "]: " + error));
        return;
      }
      embeddings.push_back(std::move(embedding));
    }
    std::optional<double> tolerance;
    if (!parseTolerance(body, tolerance, error)) {
      callback(createErrorResponse(400, "Invalid request", error));
      return;
    }

    auto result = service_->recognizeBatch(embeddings, tolerance);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value results(Json::arrayValue);
    for (const auto &item : result.value) {
      results.append(item.toJson());
    }
    Json::Value response(Json::objectValue);
    response["results"] = results;
    response["count"] = static_cast<Json::UInt64>(result.value.size());

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/recognition/recognize/batch - Success: "
                << result.value.size() << " result(s) - "
                << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/recognition/recognize/batch - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::optimizeGallery(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  auto start_time = std::chrono::steady_clock::now();

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] POST /v1/recognition/gallery/optimize - Optimize";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }

    std::optional<size_t> maxPerIdentity;
    if (!std::string(req->body()).empty()) {
      Json::Value body;
      std::string error;
      if (!ApiHelpers::parseJsonBody(req, body, error)) {
        callback(createErrorResponse(400, "Invalid request", error));
        return;
      }
      if (body.isMember("max_per_identity")) {
        if (!body["max_per_identity"].isInt64() ||
            body["max_per_identity"].asInt64() < 0) {
          callback(createErrorResponse(
              400, "Invalid request",
              "Field 'max_per_identity' must be a non-negative integer"));
          return;
        }
        maxPerIdentity =
            static_cast<size_t>(body["max_per_identity"].asUInt64());
      }
    }

    auto result = service_->optimizeGallery(maxPerIdentity);
    if (!result.ok()) {
      callback(createErrorResponse(result.errorKind, result.message));
      return;
    }

    Json::Value response(Json::objectValue);
    response["embeddings_before"] =
        static_cast<Json::UInt64>(result.value.embeddingsBefore);
    response["embeddings_after"] =
        static_cast<Json::UInt64>(result.value.embeddingsAfter);
    response["identities_trimmed"] =
        static_cast<Json::UInt64>(result.value.identitiesTrimmed);

    if (isApiLoggingEnabled()) {
      PLOG_INFO << "[API] POST /v1/recognition/gallery/optimize - Success: "
                << result.value.embeddingsBefore << " -> "
                << result.value.embeddingsAfter << " - "
                << elapsedMs(start_time) << "ms";
    }
    callback(createSuccessResponse(response));

  } catch (const std::exception &e) {
    if (isApiLoggingEnabled()) {
      PLOG_ERROR << "[API] POST /v1/recognition/gallery/optimize - Exception: "
                 << e.what();
    }
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::validateGallery(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/recognition/gallery/validate";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }
    callback(createSuccessResponse(service_->validateGallery().toJson()));
  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::getStatistics(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {

  if (isApiLoggingEnabled()) {
    PLOG_INFO << "[API] GET /v1/recognition/statistics";
  }

  try {
    if (!service_) {
      callback(createErrorResponse(500, "Internal server error",
                                   "Attendance service not initialized"));
      return;
    }
    callback(createSuccessResponse(service_->recognitionStatistics().toJson()));
  } catch (const std::exception &e) {
    callback(createErrorResponse(500, "Internal server error", e.what()));
  }
}

void RecognitionHandler::handleOptions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  callback(CorsHelper::createOptionsResponse());
}
