#include "api/routes/BatchRoutes.hpp"

#include "api/routes/RouteHelpers.hpp"
#include "common/Errors.hpp"
#include "dal/PersonRepository.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sgw::api::routes {

BatchRoutes::BatchRoutes(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog)
    : _prRepo(prRepo), _spLog(std::move(spLog)) {}

BatchRoutes::~BatchRoutes() = default;

void BatchRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /person/qry/batch_up  body: [{"name": ...}, ...]
  CROW_ROUTE(app, "/person/qry/batch_up").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          if (!jBody.is_array()) {
            throw common::ValidationError("validation_error",
                                          "body must be an array of {\"name\": string}");
          }

          std::vector<std::string> vNames;
          vNames.reserve(jBody.size());
          for (const auto& jPerson : jBody) {
            vNames.push_back(requireName(jPerson));
          }

          return jsonResponse(200, peopleToJson(_prRepo.batchCreate(vNames)));
        } catch (const common::AppError& e) {
          _spLog->warn("POST /person/qry/batch_up: {}", e.what());
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // DELETE /person/qry/batch_down
  CROW_ROUTE(app, "/person/qry/batch_down").methods("DELETE"_method)(
      [this]() -> crow::response {
        try {
          return jsonResponse(200, peopleToJson(_prRepo.deleteAll()));
        } catch (const common::AppError& e) {
          _spLog->warn("DELETE /person/qry/batch_down: {}", e.what());
          return errorResponse(e);
        }
      });
}

}  // namespace sgw::api::routes
