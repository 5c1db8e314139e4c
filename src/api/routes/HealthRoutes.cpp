#include "api/routes/HealthRoutes.hpp"

namespace sgw::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /health_check
  CROW_ROUTE(app, "/health_check").methods("GET"_method)([]() { return crow::response(200); });
}

}  // namespace sgw::api::routes
