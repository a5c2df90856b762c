#include "api/HealthServer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <chrono>
#include <string>

namespace kes::api {

HealthServer::HealthServer(const kes::core::ChangeEventStream& cesStream)
    : _hrRoutes(cesStream) {
  _app.loglevel(crow::LogLevel::Warning);
  _hrRoutes.registerRoutes(_app);
}

HealthServer::~HealthServer() {
  stop();
}

void HealthServer::start(int iPort) {
  if (_bRunning) return;

  _futRun = _app.port(static_cast<uint16_t>(iPort)).concurrency(1).run_async();
  _app.wait_for_server_start();

  // A server that already returned never came up (bind failure or early exit)
  if (_futRun.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    std::string sReason = "server exited during startup";
    try {
      _futRun.get();
    } catch (const std::exception& ex) {
      sReason = ex.what();
    }
    throw common::AppError("health_server_failed",
                           "Health endpoint failed to start on port " + std::to_string(iPort) +
                               ": " + sReason);
  }

  _bRunning = true;
  common::Logger::get()->info("Health endpoint listening on port {}", iPort);
}

void HealthServer::stop() {
  if (!_bRunning) return;
  _bRunning = false;

  _app.stop();
  try {
    _futRun.get();
  } catch (const std::exception& ex) {
    common::Logger::get()->error("HealthServer: server terminated with error: {}", ex.what());
  }
}

}  // namespace kes::api
