#include "api/routes/HealthRoutes.hpp"

#include "common/Logger.hpp"
#include "core/ChangeDetector.hpp"
#include "support/ScriptedResourceClient.hpp"

#include <crow.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

using kes::api::routes::HealthRoutes;
using kes::common::PollStats;

TEST(HealthRoutesTest, NotReadyBeforeFirstSuccessfulFetch) {
  PollStats psStats;
  psStats.uFetchFailures = 3;
  psStats.uConsecutiveFailures = 3;

  EXPECT_FALSE(HealthRoutes::isReady(psStats));

  auto jBody = HealthRoutes::statsToJson(psStats);
  EXPECT_EQ(jBody["status"].get<std::string>(), "ok");
  EXPECT_EQ(jBody["fetch_failures"].get<uint64_t>(), 3u);
  EXPECT_EQ(jBody["consecutive_failures"].get<uint64_t>(), 3u);
  EXPECT_TRUE(jBody["last_success_unix_ms"].is_null());
}

TEST(HealthRoutesTest, ReportsCountersAfterSuccess) {
  PollStats psStats;
  psStats.uCyclesCompleted = 12;
  psStats.uTrackedCount = 4;
  psStats.oLastSuccessAt =
      std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

  EXPECT_TRUE(HealthRoutes::isReady(psStats));

  auto jBody = HealthRoutes::statsToJson(psStats);
  EXPECT_EQ(jBody["cycles_completed"].get<uint64_t>(), 12u);
  EXPECT_EQ(jBody["tracked_resources"].get<uint64_t>(), 4u);
  EXPECT_EQ(jBody["consecutive_failures"].get<uint64_t>(), 0u);
  EXPECT_EQ(jBody["last_success_unix_ms"].get<int64_t>(), 1700000000123);
}

namespace {

using kes::test::makeResource;
using kes::test::ScriptedResourceClient;

/// Crow app with the health routes backed by a scripted change stream.
class HealthRoutesAppTest : public ::testing::Test {
 protected:
  void SetUp() override {
    kes::common::Logger::init("off");
    _client.pushSnapshot({makeResource("uid-a", "1", "a"), makeResource("uid-b", "1", "b")});
    _upStream = kes::core::ChangeDetector::openChangeStream(
        _client, {"kubernetes-client.io", "v1", "externalsecrets", std::nullopt},
        std::chrono::milliseconds(1000), kes::common::Logger::get());
    _upRoutes = std::make_unique<HealthRoutes>(*_upStream);
    _upRoutes->registerRoutes(_app);
    _app.validate();
  }

  crow::response get(const std::string& sUrl) {
    crow::request req;
    req.method = crow::HTTPMethod::Get;
    req.url = sUrl;
    crow::response res;
    _app.handle_full(req, res);
    return res;
  }

  ScriptedResourceClient _client;
  std::unique_ptr<kes::core::ChangeEventStream> _upStream;
  std::unique_ptr<HealthRoutes> _upRoutes;
  crow::SimpleApp _app;
};

}  // namespace

TEST_F(HealthRoutesAppTest, ReadyzIsUnavailableUntilFirstFetch) {
  auto res = get("/readyz");
  EXPECT_EQ(res.code, 503);
  auto jBody = nlohmann::json::parse(res.body);
  EXPECT_FALSE(jBody["ready"].get<bool>());

  ASSERT_TRUE(_upStream->next().has_value());

  res = get("/readyz");
  EXPECT_EQ(res.code, 200);
  jBody = nlohmann::json::parse(res.body);
  EXPECT_TRUE(jBody["ready"].get<bool>());
}

TEST_F(HealthRoutesAppTest, HealthzServesPollStatistics) {
  auto res = get("/healthz");
  EXPECT_EQ(res.code, 200);
  auto jBody = nlohmann::json::parse(res.body);
  EXPECT_EQ(jBody["status"].get<std::string>(), "ok");
  EXPECT_EQ(jBody["tracked_resources"].get<uint64_t>(), 0u);
  EXPECT_TRUE(jBody["last_success_unix_ms"].is_null());

  ASSERT_TRUE(_upStream->next().has_value());
  ASSERT_TRUE(_upStream->next().has_value());

  res = get("/healthz");
  EXPECT_EQ(res.code, 200);
  jBody = nlohmann::json::parse(res.body);
  EXPECT_EQ(jBody["tracked_resources"].get<uint64_t>(), 2u);
  EXPECT_EQ(jBody["fetch_failures"].get<uint64_t>(), 0u);
  EXPECT_FALSE(jBody["last_success_unix_ms"].is_null());
}

TEST_F(HealthRoutesAppTest, UnknownPathIsNotFound) {
  EXPECT_EQ(get("/metrics").code, 404);
}
