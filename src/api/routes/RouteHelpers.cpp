#include "api/routes/RouteHelpers.hpp"

namespace sgw::api::routes {

crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response errorResponse(const common::AppError& e) {
  nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
  return jsonResponse(e._iHttpStatus, jErr);
}

crow::response invalidJsonResponse() {
  nlohmann::json jErr = {{"error", "invalid_json"}, {"message", "Invalid JSON body"}};
  return jsonResponse(400, jErr);
}

nlohmann::json personToJson(const common::Person& pn) {
  return {{"id", pn.sId}, {"name", pn.sName}};
}

nlohmann::json peopleToJson(const std::vector<common::Person>& vPeople) {
  auto jArr = nlohmann::json::array();
  for (const auto& pn : vPeople) {
    jArr.push_back(personToJson(pn));
  }
  return jArr;
}

std::string requireName(const nlohmann::json& jBody) {
  if (!jBody.is_object() || !jBody.contains("name") || !jBody["name"].is_string()) {
    throw common::ValidationError("validation_error", "name is required and must be a string");
  }
  return jBody["name"].get<std::string>();
}

}  // namespace sgw::api::routes
