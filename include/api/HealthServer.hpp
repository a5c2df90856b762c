#pragma once

#include <future>
#include <memory>

#include <crow.h>

#include "api/routes/HealthRoutes.hpp"

namespace kes::api {

/// Owns the Crow application instance serving the health routes.
/// Class abbreviation: hs
class HealthServer {
 public:
  explicit HealthServer(const kes::core::ChangeEventStream& cesStream);
  ~HealthServer();

  HealthServer(const HealthServer&) = delete;
  HealthServer& operator=(const HealthServer&) = delete;

  /// Start serving on iPort in the background. Idempotent.
  /// Returns once the listener is up; throws AppError if it fails to come up.
  void start(int iPort);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::HealthRoutes _hrRoutes;
  std::future<void> _futRun;
  bool _bRunning = false;
};

}  // namespace kes::api
