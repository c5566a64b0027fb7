#include "api/health_handler.h"
#include "attendance/attendance_service.h"
#include "test_support.h"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <gtest/gtest.h>
#include <json/json.h>
#include <memory>

using namespace drogon;

class HealthHandlerTest : public ::testing::Test {
protected:
  void SetUp() override { handler_ = std::make_unique<HealthHandler>(); }

  void TearDown() override {
    HealthHandler::setAttendanceService(nullptr);
    handler_.reset();
  }

  HttpResponsePtr getHealth() {
    auto req = HttpRequest::newHttpRequest();
    req->setPath("/v1/core/health");
    req->setMethod(Get);

    HttpResponsePtr response;
    handler_->getHealth(req,
                        [&](const HttpResponsePtr &resp) { response = resp; });
    return response;
  }

  std::unique_ptr<HealthHandler> handler_;
};

// Test health endpoint returns valid JSON with an attached service
TEST_F(HealthHandlerTest, HealthyWithService) {
  ManualClock clock;
  AttendanceServiceOptions options;
  options.recognition.embeddingDimension = 3;
  AttendanceService service(options, std::make_unique<MemoryAttendanceStorage>(),
                            clock.fn());
  service.addIdentity("Alice", {{0.1f, 0.2f, 0.3f}, {0.3f, 0.2f, 0.1f}});
  HealthHandler::setAttendanceService(&service);

  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k200OK);
  EXPECT_EQ(response->contentType(), CT_APPLICATION_JSON);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_EQ((*json)["status"].asString(), "healthy");
  EXPECT_EQ((*json)["service"].asString(), "face_attendance_api");
  EXPECT_TRUE(json->isMember("timestamp"));
  EXPECT_TRUE(json->isMember("version"));
  EXPECT_GE((*json)["uptime"].asInt64(), 0);
  EXPECT_TRUE((*json)["checks"]["service"].asBool());
  EXPECT_TRUE((*json)["checks"]["gallery"].asBool());
  EXPECT_EQ((*json)["registered_identities"].asUInt64(), 1u);
  EXPECT_EQ((*json)["total_embeddings"].asUInt64(), 2u);
}

// Test health reports unhealthy without a service
TEST_F(HealthHandlerTest, UnhealthyWithoutService) {
  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->statusCode(), k503ServiceUnavailable);

  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);
  EXPECT_EQ((*json)["status"].asString(), "unhealthy");
  EXPECT_FALSE((*json)["checks"]["service"].asBool());
  EXPECT_FALSE(json->isMember("total_embeddings"));
}

// Test timestamp is ISO 8601 UTC
TEST_F(HealthHandlerTest, TimestampFormat) {
  auto response = getHealth();
  ASSERT_NE(response, nullptr);
  auto json = response->getJsonObject();
  ASSERT_NE(json, nullptr);

  std::string timestamp = (*json)["timestamp"].asString();
  ASSERT_EQ(timestamp.size(), 24u);
  EXPECT_EQ(timestamp[10], 'T');
  EXPECT_EQ(timestamp.back(), 'Z');
}
