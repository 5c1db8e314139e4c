#pragma once

#include <string>
#include <vector>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/Types.hpp"

namespace sgw::api::routes {

/// JSON body with the Content-Type header set.
crow::response jsonResponse(int iStatus, const nlohmann::json& jBody);

/// {"error": code, "message": text} with the error's HTTP status.
crow::response errorResponse(const common::AppError& e);

/// 400 for a request body that is not valid JSON.
crow::response invalidJsonResponse();

nlohmann::json personToJson(const common::Person& pn);
nlohmann::json peopleToJson(const std::vector<common::Person>& vPeople);

/// Extract the "name" field of a {"name": string} body.
/// Throws ValidationError when it is missing or not a string.
std::string requireName(const nlohmann::json& jBody);

}  // namespace sgw::api::routes
