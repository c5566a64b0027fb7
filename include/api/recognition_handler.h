#pragma once

#include "recognition/gallery_types.h"
#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

using namespace drogon;

class AttendanceService;

/**
 * @brief Identity gallery and recognition handler
 *
 * Endpoints:
 * - POST /v1/recognition/identities - Add embeddings under a label
 * - GET /v1/recognition/identities - Gallery statistics
 * - DELETE /v1/recognition/identities/{label} - Remove an identity
 * - POST /v1/recognition/recognize - Match one embedding
 * - POST /v1/recognition/recognize/batch - Match several embeddings
 * - POST /v1/recognition/gallery/optimize - Cap embeddings per identity
 * - GET /v1/recognition/gallery/validate - Gallery integrity report
 * - GET /v1/recognition/statistics - Recognition counters
 */
class RecognitionHandler : public drogon::HttpController<RecognitionHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(RecognitionHandler::addIdentity, "/v1/recognition/identities", Post);
        ADD_METHOD_TO(RecognitionHandler::listIdentities, "/v1/recognition/identities", Get);
        ADD_METHOD_TO(RecognitionHandler::removeIdentity, "/v1/recognition/identities/{label}", Delete);
        ADD_METHOD_TO(RecognitionHandler::recognize, "/v1/recognition/recognize", Post);
        ADD_METHOD_TO(RecognitionHandler::recognizeBatch, "/v1/recognition/recognize/batch", Post);
        ADD_METHOD_TO(RecognitionHandler::optimizeGallery, "/v1/recognition/gallery/optimize", Post);
        ADD_METHOD_TO(RecognitionHandler::validateGallery, "/v1/recognition/gallery/validate", Get);
        ADD_METHOD_TO(RecognitionHandler::getStatistics, "/v1/recognition/statistics", Get);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/recognition/identities", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/recognition/identities/{label}", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/recognition/recognize", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/recognition/recognize/batch", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/recognition/gallery/optimize", Options);
    METHOD_LIST_END

    /**
     * @brief Handle POST /v1/recognition/identities
     * Body: {"label": "Alice", "embeddings": [[...], [...]]}
     */
    void addIdentity(const HttpRequestPtr &req,
                     std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/recognition/identities
     */
    void listIdentities(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle DELETE /v1/recognition/identities/{label}
     * Unknown labels are not an error: 200 with removed = 0
     */
    void removeIdentity(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/recognition/recognize
     * Body: {"embedding": [...], "tolerance": 0.4, "mark_attendance": false}
     * With mark_attendance set, a matched identity is also marked present.
     */
    void recognize(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/recognition/recognize/batch
     * Body: {"embeddings": [[...], ...], "tolerance": 0.4}
     */
    void recognizeBatch(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/recognition/gallery/optimize
     * Body (optional): {"max_per_identity": 10}
     */
    void optimizeGallery(const HttpRequestPtr &req,
                         std::function<void(const HttpResponsePtr &)> &&callback);

    void validateGallery(const HttpRequestPtr &req,
                         std::function<void(const HttpResponsePtr &)> &&callback);

    void getStatistics(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle OPTIONS request for CORS preflight
     */
    void handleOptions(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set attendance service (dependency injection)
     */
    static void setAttendanceService(AttendanceService *service);

private:
    static AttendanceService *service_;

    /**
     * @brief Parse a JSON array of numbers into an embedding
     */
    static bool parseEmbedding(const Json::Value &json, Embedding &embedding,
                               std::string &error);

    /**
     * @brief Read optional "tolerance" from body
     * @return false with error set when present but not a number
     */
    static bool parseTolerance(const Json::Value &body,
                               std::optional<double> &tolerance,
                               std::string &error);
};
