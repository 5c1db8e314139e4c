#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "dal/ResultSet.hpp"

namespace sgw::dal {

/// Pure abstract submit-and-wait channel to the database engine.
/// One logical connection: callers serialize units of work on it.
class ISession {
 public:
  virtual ~ISession() = default;

  /// Submit a script (one or more ';'-separated statements) with bound
  /// parameters and wait for its result set, one slot per statement.
  /// ERR slots are returned as-is; callers decide with ResultSet::check().
  /// Throws ExecutionError when the script could not be submitted, and
  /// IndeterminateOutcomeError when the round-trip was interrupted after
  /// the script left the client.
  virtual ResultSet query(const std::string& sScript,
                          const nlohmann::json& jVars = nlohmann::json::object()) = 0;
};

}  // namespace sgw::dal
