#pragma once

#include <crow.h>

namespace sgw::api::routes {

/// Handler for /health_check
/// Class abbreviation: hr
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);
};

}  // namespace sgw::api::routes
