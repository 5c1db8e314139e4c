#pragma once

#include <memory>

#include <crow.h>
#include <spdlog/spdlog.h>

namespace sgw::dal {
class PersonRepository;
}

namespace sgw::api::routes {
class BatchRoutes;
class HealthRoutes;
class PersonRoutes;
}  // namespace sgw::api::routes

namespace sgw::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog);
  ~ApiServer();

  void registerRoutes();

  /// Serve until stop() is called. Blocks the calling thread.
  void start(int iPort, int iThreads);
  void stop();

  crow::SimpleApp& app() { return _app; }

 private:
  crow::SimpleApp _app;
  std::shared_ptr<spdlog::logger> _spLog;
  std::unique_ptr<routes::PersonRoutes> _upPersonRoutes;
  std::unique_ptr<routes::BatchRoutes> _upBatchRoutes;
  std::unique_ptr<routes::HealthRoutes> _upHealthRoutes;
};

}  // namespace sgw::api
