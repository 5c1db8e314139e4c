#pragma once

#include <memory>

#include <crow.h>
#include <spdlog/spdlog.h>

namespace sgw::dal {
class PersonRepository;
}

namespace sgw::api::routes {

/// Handlers for /person/<id> and /people
/// Class abbreviation: pnr
class PersonRoutes {
 public:
  PersonRoutes(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog);
  ~PersonRoutes();

  /// Register person CRUD routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  dal::PersonRepository& _prRepo;
  std::shared_ptr<spdlog::logger> _spLog;
};

}  // namespace sgw::api::routes
