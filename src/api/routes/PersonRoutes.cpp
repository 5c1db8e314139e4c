#include "api/routes/PersonRoutes.hpp"

#include "api/routes/RouteHelpers.hpp"
#include "common/Errors.hpp"
#include "dal/PersonRepository.hpp"

#include <nlohmann/json.hpp>

namespace sgw::api::routes {

PersonRoutes::PersonRoutes(dal::PersonRepository& prRepo, std::shared_ptr<spdlog::logger> spLog)
    : _prRepo(prRepo), _spLog(std::move(spLog)) {}

PersonRoutes::~PersonRoutes() = default;

void PersonRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /person/<id>
  CROW_ROUTE(app, "/person/<string>").methods("POST"_method)(
      [this](const crow::request& req, const std::string& sId) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          auto pn = _prRepo.create(sId, requireName(jBody));
          return jsonResponse(201, personToJson(pn));
        } catch (const common::AppError& e) {
          _spLog->warn("POST /person/{}: {}", sId, e.what());
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // GET /person/<id>
  CROW_ROUTE(app, "/person/<string>").methods("GET"_method)(
      [this](const std::string& sId) -> crow::response {
        try {
          auto oPerson = _prRepo.findById(sId);
          if (!oPerson) {
            throw common::NotFoundError("person_not_found", "person:" + sId + " does not exist");
          }
          return jsonResponse(200, personToJson(*oPerson));
        } catch (const common::AppError& e) {
          _spLog->warn("GET /person/{}: {}", sId, e.what());
          return errorResponse(e);
        }
      });

  // PUT /person/<id>
  CROW_ROUTE(app, "/person/<string>").methods("PUT"_method)(
      [this](const crow::request& req, const std::string& sId) -> crow::response {
        try {
          auto jBody = nlohmann::json::parse(req.body);
          auto pn = _prRepo.update(sId, requireName(jBody));
          return jsonResponse(200, personToJson(pn));
        } catch (const common::AppError& e) {
          _spLog->warn("PUT /person/{}: {}", sId, e.what());
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // DELETE /person/<id>
  CROW_ROUTE(app, "/person/<string>").methods("DELETE"_method)(
      [this](const std::string& sId) -> crow::response {
        try {
          auto pn = _prRepo.remove(sId);
          return jsonResponse(200, personToJson(pn));
        } catch (const common::AppError& e) {
          _spLog->warn("DELETE /person/{}: {}", sId, e.what());
          return errorResponse(e);
        }
      });

  // GET /people
  CROW_ROUTE(app, "/people").methods("GET"_method)([this]() -> crow::response {
    try {
      return jsonResponse(200, peopleToJson(_prRepo.list()));
    } catch (const common::AppError& e) {
      _spLog->warn("GET /people: {}", e.what());
      return errorResponse(e);
    }
  });
}

}  // namespace sgw::api::routes
