#include <gtest/gtest.h>
#include "api/recognition_handler.h"
#include "attendance/attendance_service.h"
#include "storage/file_attendance_storage.h"
#include "test_support.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <filesystem>
#include <memory>

using namespace drogon;

class RecognitionHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler_ = std::make_unique<RecognitionHandler>();

        test_dir_ = makeTestDirectory("test_recognition_handler");
        AttendanceServiceOptions options;
        options.recognition.embeddingDimension = 4;
        options.recognition.tolerance = 0.4;
        options.recognition.maxEmbeddingsPerIdentity = 3;
        options.backupRoot = (test_dir_ / "backups").string();
        service_ = std::make_unique<AttendanceService>(
            options, std::make_unique<FileAttendanceStorage>(test_dir_.string()),
            clock_.fn());

        RecognitionHandler::setAttendanceService(service_.get());
    }

    void TearDown() override {
        handler_.reset();
        RecognitionHandler::setAttendanceService(nullptr);
        service_.reset();

        if (std::filesystem::exists(test_dir_)) {
            std::filesystem::remove_all(test_dir_);
        }
    }

    static HttpRequestPtr jsonRequest(const std::string &path, HttpMethod method,
                                      const Json::Value &body) {
        auto req = HttpRequest::newHttpRequest();
        req->setPath(path);
        req->setMethod(method);
        req->setContentTypeCode(CT_APPLICATION_JSON);
        req->setBody(body.toStyledString());
        return req;
    }

    static Json::Value vector4(float a, float b, float c, float d) {
        Json::Value v(Json::arrayValue);
        v.append(a);
        v.append(b);
        v.append(c);
        v.append(d);
        return v;
    }

    HttpResponsePtr addAlice() {
        Json::Value body;
        body["label"] = "Alice";
        body["embeddings"].append(vector4(0.1f, 0.2f, 0.3f, 0.4f));
        HttpResponsePtr response;
        handler_->addIdentity(
            jsonRequest("/v1/recognition/identities", Post, body),
            [&](const HttpResponsePtr &resp) { response = resp; });
        return response;
    }

    std::unique_ptr<RecognitionHandler> handler_;
    std::unique_ptr<AttendanceService> service_;
    ManualClock clock_;
    std::filesystem::path test_dir_;
};

// Test POST /v1/recognition/identities registers embeddings
TEST_F(RecognitionHandlerTest, AddIdentityReturnsCreated) {
    auto response = addAlice();
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k201Created);
    EXPECT_EQ(response->contentType(), CT_APPLICATION_JSON);

    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["label"].asString(), "Alice");
    EXPECT_EQ((*json)["added"].asUInt64(), 1u);
    EXPECT_EQ((*json)["total_embeddings"].asUInt64(), 1u);
}

// Test wrong-length embedding answers 400 with the error kind
TEST_F(RecognitionHandlerTest, AddIdentityDimensionMismatch) {
    Json::Value body;
    body["label"] = "Alice";
    Json::Value shortVector(Json::arrayValue);
    shortVector.append(0.1);
    shortVector.append(0.2);
    body["embeddings"].append(shortVector);

    HttpResponsePtr response;
    handler_->addIdentity(jsonRequest("/v1/recognition/identities", Post, body),
                          [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["kind"].asString(), "dimension_mismatch");
}

// Test missing fields and malformed bodies answer 400
TEST_F(RecognitionHandlerTest, AddIdentityInvalidBody) {
    Json::Value noLabel;
    noLabel["embeddings"] = Json::Value(Json::arrayValue);
    HttpResponsePtr response;
    handler_->addIdentity(jsonRequest("/v1/recognition/identities", Post, noLabel),
                          [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);

    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/recognition/identities");
    req->setMethod(Post);
    req->setBody("{invalid json");
    response.reset();
    handler_->addIdentity(req, [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);

    Json::Value badValue;
    badValue["label"] = "Alice";
    Json::Value vec(Json::arrayValue);
    vec.append("x");
    badValue["embeddings"].append(vec);
    response.reset();
    handler_->addIdentity(jsonRequest("/v1/recognition/identities", Post, badValue),
                          [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);
}

// Test POST /v1/recognition/recognize matches a registered identity
TEST_F(RecognitionHandlerTest, RecognizeKnownIdentity) {
    addAlice();

    Json::Value body;
    body["embedding"] = vector4(0.1f, 0.2f, 0.3f, 0.4f);
    HttpResponsePtr response;
    handler_->recognize(jsonRequest("/v1/recognition/recognize", Post, body),
                        [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["label"].asString(), "Alice");
    EXPECT_TRUE((*json)["matched"].asBool());
    EXPECT_NEAR((*json)["confidence"].asDouble(), 1.0, 1e-6);
    EXPECT_FALSE(json->isMember("attendance"));
}

// Test recognize against an empty gallery answers Unknown
TEST_F(RecognitionHandlerTest, RecognizeEmptyGallery) {
    Json::Value body;
    body["embedding"] = vector4(0.5f, 0.5f, 0.5f, 0.5f);
    HttpResponsePtr response;
    handler_->recognize(jsonRequest("/v1/recognition/recognize", Post, body),
                        [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["label"].asString(), "Unknown");
    EXPECT_DOUBLE_EQ((*json)["confidence"].asDouble(), 0.0);
}

// Test recognize with mark_attendance marks once and then reports duplicates
TEST_F(RecognitionHandlerTest, RecognizeAndMarkAttendance) {
    addAlice();

    Json::Value body;
    body["embedding"] = vector4(0.1f, 0.2f, 0.3f, 0.4f);
    body["mark_attendance"] = true;

    HttpResponsePtr first;
    handler_->recognize(jsonRequest("/v1/recognition/recognize", Post, body),
                        [&](const HttpResponsePtr &resp) { first = resp; });
    ASSERT_NE(first, nullptr);
    auto firstJson = first->getJsonObject();
    ASSERT_NE(firstJson, nullptr);
    EXPECT_EQ((*firstJson)["attendance"]["status"].asString(), "success");

    HttpResponsePtr second;
    handler_->recognize(jsonRequest("/v1/recognition/recognize", Post, body),
                        [&](const HttpResponsePtr &resp) { second = resp; });
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->statusCode(), k200OK);
    auto secondJson = second->getJsonObject();
    ASSERT_NE(secondJson, nullptr);
    EXPECT_EQ((*secondJson)["attendance"]["status"].asString(), "already_marked");
    EXPECT_EQ((*secondJson)["attendance"]["first_check_in"].asString(), "09:00:00");
}

// Test a negative tolerance answers 400
TEST_F(RecognitionHandlerTest, RecognizeNegativeTolerance) {
    addAlice();

    Json::Value body;
    body["embedding"] = vector4(0.1f, 0.2f, 0.3f, 0.4f);
    body["tolerance"] = -0.5;
    HttpResponsePtr response;
    handler_->recognize(jsonRequest("/v1/recognition/recognize", Post, body),
                        [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["kind"].asString(), "invalid_argument");
}

// Test a value beyond float range answers 400 instead of a -inf confidence
TEST_F(RecognitionHandlerTest, RecognizeOverflowingValue) {
    addAlice();

    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/recognition/recognize");
    req->setMethod(Post);
    req->setContentTypeCode(CT_APPLICATION_JSON);
    req->setBody("{\"embedding\": [1e39, 0.2, 0.3, 0.4]}");
    HttpResponsePtr response;
    handler_->recognize(req, [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k400BadRequest);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["kind"].asString(), "invalid_argument");
    EXPECT_EQ(service_->recognitionStatistics().totalRecognitions, 0u);
}

// Test batch recognition keeps input order
TEST_F(RecognitionHandlerTest, RecognizeBatch) {
    addAlice();

    Json::Value body;
    body["embeddings"].append(vector4(9, 9, 9, 9));
    body["embeddings"].append(vector4(0.1f, 0.2f, 0.3f, 0.4f));
    HttpResponsePtr response;
    handler_->recognizeBatch(
        jsonRequest("/v1/recognition/recognize/batch", Post, body),
        [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["count"].asUInt64(), 2u);
    EXPECT_EQ((*json)["results"][0]["label"].asString(), "Unknown");
    EXPECT_EQ((*json)["results"][1]["label"].asString(), "Alice");
}

// Test DELETE removes an identity and unknown labels answer removed = 0
TEST_F(RecognitionHandlerTest, RemoveIdentity) {
    addAlice();

    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/recognition/identities/Alice");
    req->setMethod(Delete);
    HttpResponsePtr response;
    handler_->removeIdentity(req, [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["removed"].asUInt64(), 1u);
    EXPECT_EQ((*json)["status"].asString(), "success");

    response.reset();
    handler_->removeIdentity(req, [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["removed"].asUInt64(), 0u);
    EXPECT_EQ((*json)["status"].asString(), "not_found");
}

// Test DELETE takes the label from the path and ignores a label query
TEST_F(RecognitionHandlerTest, RemoveIgnoresLabelQueryParameter) {
    addAlice();
    Json::Value bob;
    bob["label"] = "Bob";
    bob["embeddings"].append(vector4(0.9f, 0.9f, 0.9f, 0.9f));
    handler_->addIdentity(jsonRequest("/v1/recognition/identities", Post, bob),
                          [](const HttpResponsePtr &) {});

    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/recognition/identities/Alice");
    req->setParameter("label", "Bob");
    req->setMethod(Delete);
    HttpResponsePtr response;
    handler_->removeIdentity(req, [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto stats = service_->galleryStatistics();
    ASSERT_EQ(stats.identityCounts.size(), 1u);
    EXPECT_EQ(stats.identityCounts[0].first, "Bob");
    EXPECT_EQ(stats.totalEmbeddings, 1u);
    EXPECT_EQ(service_->recognize({0.9f, 0.9f, 0.9f, 0.9f}).value.label, "Bob");
}

// Test listing, validation and statistics endpoints
TEST_F(RecognitionHandlerTest, GalleryInspectionEndpoints) {
    addAlice();
    auto req = HttpRequest::newHttpRequest();
    req->setMethod(Get);

    HttpResponsePtr list;
    handler_->listIdentities(req, [&](const HttpResponsePtr &resp) { list = resp; });
    ASSERT_NE(list, nullptr);
    auto listJson = list->getJsonObject();
    ASSERT_NE(listJson, nullptr);
    EXPECT_EQ((*listJson)["registered_identities"].asUInt64(), 1u);
    EXPECT_EQ((*listJson)["identities"][0]["label"].asString(), "Alice");

    HttpResponsePtr validate;
    handler_->validateGallery(req, [&](const HttpResponsePtr &resp) { validate = resp; });
    ASSERT_NE(validate, nullptr);
    auto validateJson = validate->getJsonObject();
    ASSERT_NE(validateJson, nullptr);
    EXPECT_TRUE((*validateJson)["valid"].asBool());

    HttpResponsePtr stats;
    handler_->getStatistics(req, [&](const HttpResponsePtr &resp) { stats = resp; });
    ASSERT_NE(stats, nullptr);
    auto statsJson = stats->getJsonObject();
    ASSERT_NE(statsJson, nullptr);
    EXPECT_TRUE(statsJson->isMember("total_recognitions"));
    EXPECT_EQ((*statsJson)["total_embeddings"].asUInt64(), 1u);
}

// Test optimize trims to the requested bound
TEST_F(RecognitionHandlerTest, OptimizeGallery) {
    Json::Value add;
    add["label"] = "Bob";
    for (int i = 0; i < 4; ++i) {
        add["embeddings"].append(vector4(static_cast<float>(i), 0, 0, 0));
    }
    handler_->addIdentity(jsonRequest("/v1/recognition/identities", Post, add),
                          [](const HttpResponsePtr &) {});

    Json::Value body;
    body["max_per_identity"] = 2;
    HttpResponsePtr response;
    handler_->optimizeGallery(
        jsonRequest("/v1/recognition/gallery/optimize", Post, body),
        [&](const HttpResponsePtr &resp) { response = resp; });

    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k200OK);
    auto json = response->getJsonObject();
    ASSERT_NE(json, nullptr);
    EXPECT_EQ((*json)["embeddings_before"].asUInt64(), 4u);
    EXPECT_EQ((*json)["embeddings_after"].asUInt64(), 2u);
    EXPECT_EQ((*json)["identities_trimmed"].asUInt64(), 1u);
}

// Test handlers answer 500 when no service is attached
TEST_F(RecognitionHandlerTest, NoServiceReturnsError) {
    RecognitionHandler::setAttendanceService(nullptr);

    HttpResponsePtr response;
    handler_->listIdentities(HttpRequest::newHttpRequest(),
                             [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->statusCode(), k500InternalServerError);
}

// Test OPTIONS preflight carries CORS headers
TEST_F(RecognitionHandlerTest, OptionsPreflight) {
    HttpResponsePtr response;
    handler_->handleOptions(HttpRequest::newHttpRequest(),
                            [&](const HttpResponsePtr &resp) { response = resp; });
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->getHeader("Access-Control-Allow-Origin"), "*");
}
