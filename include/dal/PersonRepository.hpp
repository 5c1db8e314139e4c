#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/Types.hpp"
#include "dal/ISession.hpp"

namespace sgw::dal {

/// CRUD and batch operations on the person table.
/// Each call is one unit of work on the shared session; a mutex keeps
/// concurrent callers from interleaving inside a transaction.
/// Class abbreviation: pr
class PersonRepository {
 public:
  PersonRepository(ISession& sess, std::shared_ptr<spdlog::logger> spLog);
  ~PersonRepository();

  /// Create person:<sKey>. Throws ConflictError if the record exists.
  common::Person create(const std::string& sKey, const std::string& sName);

  /// Returns nullopt if the record does not exist.
  std::optional<common::Person> findById(const std::string& sKey);

  /// Replace the content of person:<sKey>, creating it when absent.
  common::Person update(const std::string& sKey, const std::string& sName);

  /// Delete person:<sKey> and return it. Throws NotFoundError if absent.
  common::Person remove(const std::string& sKey);

  std::vector<common::Person> list();

  /// Create one person per name in a single composite transaction.
  /// Either all are created or none. Returns the created records in order.
  std::vector<common::Person> batchCreate(const std::vector<std::string>& vNames);

  /// Delete every person inside an explicit transaction and return the
  /// deleted records.
  std::vector<common::Person> deleteAll();

  /// Convert a result row ({id, name, ...}) to a Person.
  /// Throws ExecutionError on an unexpected shape.
  static common::Person fromRow(const nlohmann::json& jRow);

 private:
  std::vector<common::Person> rowsOf(const nlohmann::json& jRows) const;
  void requireKey(const std::string& sKey) const;

  ISession& _sess;
  std::shared_ptr<spdlog::logger> _spLog;
  std::mutex _mtx;
};

}  // namespace sgw::dal
