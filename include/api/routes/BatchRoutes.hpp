#pragma once

#include <memory>

#include <crow.h>
#include <spdlog/spdlog.h>

namespace sgw::dal {
class PersonRepository;
}

namespace sgw::api::routes {

/// Handlers for /person/qry/batch_up and /person/qry/batch_down
/// Class abbreviation: br
class BatchRoutes {
 public:
  BatchRoutes(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog);
  ~BatchRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  dal::PersonRepository& _prRepo;
  std::shared_ptr<spdlog::logger> _spLog;
};

}  // namespace sgw::api::routes
