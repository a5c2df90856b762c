#pragma once

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace kes::core {
class ChangeEventStream;
}

namespace kes::api::routes {

/// Handlers for /healthz and /readyz
/// Class abbreviation: hr
class HealthRoutes {
 public:
  explicit HealthRoutes(const kes::core::ChangeEventStream& cesStream);
  ~HealthRoutes();

  /// Register health routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

  /// Body of GET /healthz.
  static nlohmann::json statsToJson(const common::PollStats& psStats);

  /// Ready once at least one fetch has succeeded.
  static bool isReady(const common::PollStats& psStats);

 private:
  const kes::core::ChangeEventStream& _cesStream;
};

}  // namespace kes::api::routes
