#include "api/ApiServer.hpp"

#include "api/routes/BatchRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/PersonRoutes.hpp"

#include <cstdint>

namespace sgw::api {

ApiServer::ApiServer(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog)
    : _spLog(std::move(spLog)),
      _upPersonRoutes(std::make_unique<routes::PersonRoutes>(prRepo, _spLog)),
      _upBatchRoutes(std::make_unique<routes::BatchRoutes>(prRepo, _spLog)),
      _upHealthRoutes(std::make_unique<routes::HealthRoutes>()) {
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _upHealthRoutes->registerRoutes(_app);
  _upPersonRoutes->registerRoutes(_app);
  _upBatchRoutes->registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  _spLog->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.port(static_cast<std::uint16_t>(iPort))
      .concurrency(static_cast<std::uint16_t>(iThreads))
      .run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace sgw::api
