#include "api/routes/HealthRoutes.hpp"

#include "core/ChangeDetector.hpp"

#include <chrono>

namespace kes::api::routes {

HealthRoutes::HealthRoutes(const kes::core::ChangeEventStream& cesStream)
    : _cesStream(cesStream) {}

HealthRoutes::~HealthRoutes() = default;

nlohmann::json HealthRoutes::statsToJson(const common::PollStats& psStats) {
  nlohmann::json jStats = {
      {"status", "ok"},
      {"cycles_completed", psStats.uCyclesCompleted},
      {"fetch_failures", psStats.uFetchFailures},
      {"consecutive_failures", psStats.uConsecutiveFailures},
      {"tracked_resources", psStats.uTrackedCount},
  };
  if (psStats.oLastSuccessAt) {
    jStats["last_success_unix_ms"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            psStats.oLastSuccessAt->time_since_epoch())
            .count();
  } else {
    jStats["last_success_unix_ms"] = nullptr;
  }
  return jStats;
}

bool HealthRoutes::isReady(const common::PollStats& psStats) {
  return psStats.oLastSuccessAt.has_value();
}

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /healthz
  CROW_ROUTE(app, "/healthz").methods("GET"_method)([this]() -> crow::response {
    crow::response resp(200, statsToJson(_cesStream.stats()).dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });

  // GET /readyz
  CROW_ROUTE(app, "/readyz").methods("GET"_method)([this]() -> crow::response {
    const bool bReady = isReady(_cesStream.stats());
    nlohmann::json jResp = {{"ready", bReady}};
    crow::response resp(bReady ? 200 : 503, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace kes::api::routes
