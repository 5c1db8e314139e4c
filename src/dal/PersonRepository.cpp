#include "dal/PersonRepository.hpp"

#include "common/Errors.hpp"
#include "dal/StatementBatch.hpp"
#include "dal/Transaction.hpp"
#include "surql/Ast.hpp"

namespace sgw::dal {

namespace {

const char* const kTable = "person";

nlohmann::json thingVars(const std::string& sKey) {
  return {{"tb", kTable}, {"id", sKey}};
}

bool isDuplicate(const common::ExecutionError& e) {
  return e._sEngineMessage.find("already exists") != std::string::npos;
}

const StatementResult& firstSlot(const ResultSet& rsResult) {
  if (rsResult.empty()) {
    throw common::ExecutionError("Query reply carries no result slot");
  }
  return rsResult.at(0);
}

}  // namespace

PersonRepository::PersonRepository(ISession& sess, std::shared_ptr<spdlog::logger> spLog)
    : _sess(sess), _spLog(std::move(spLog)) {}

PersonRepository::~PersonRepository() = default;

common::Person PersonRepository::create(const std::string& sKey, const std::string& sName) {
  requireKey(sKey);
  std::lock_guard<std::mutex> lock(_mtx);

  auto jVars = thingVars(sKey);
  jVars["content"] = {{"name", sName}};
  auto rsResult = _sess.query("CREATE type::thing($tb, $id) CONTENT $content", jVars);
  try {
    rsResult.check();
  } catch (const common::ExecutionError& e) {
    if (isDuplicate(e)) {
      throw common::ConflictError("person_exists", "person:" + sKey + " already exists");
    }
    throw;
  }

  auto vPeople = rowsOf(firstSlot(rsResult).jResult);
  if (vPeople.empty()) {
    throw common::ExecutionError("CREATE returned no record for person:" + sKey, 0);
  }
  _spLog->info("Created {}", vPeople.front().sId);
  return vPeople.front();
}

std::optional<common::Person> PersonRepository::findById(const std::string& sKey) {
  requireKey(sKey);
  std::lock_guard<std::mutex> lock(_mtx);

  auto rsResult = _sess.query("SELECT * FROM type::thing($tb, $id)", thingVars(sKey));
  rsResult.check();

  auto vPeople = rowsOf(firstSlot(rsResult).jResult);
  if (vPeople.empty()) return std::nullopt;
  return vPeople.front();
}

common::Person PersonRepository::update(const std::string& sKey, const std::string& sName) {
  requireKey(sKey);
  std::lock_guard<std::mutex> lock(_mtx);

  auto jVars = thingVars(sKey);
  jVars["content"] = {{"name", sName}};
  auto rsResult = _sess.query("UPDATE type::thing($tb, $id) CONTENT $content", jVars);
  rsResult.check();

  auto vPeople = rowsOf(firstSlot(rsResult).jResult);
  if (vPeople.empty()) {
    throw common::ExecutionError("UPDATE returned no record for person:" + sKey, 0);
  }
  _spLog->info("Updated {}", vPeople.front().sId);
  return vPeople.front();
}

common::Person PersonRepository::remove(const std::string& sKey) {
  requireKey(sKey);
  std::lock_guard<std::mutex> lock(_mtx);

  auto rsResult = _sess.query("DELETE type::thing($tb, $id) RETURN BEFORE", thingVars(sKey));
  rsResult.check();

  auto vPeople = rowsOf(firstSlot(rsResult).jResult);
  if (vPeople.empty()) {
    throw common::NotFoundError("person_not_found", "person:" + sKey + " does not exist");
  }
  _spLog->info("Deleted {}", vPeople.front().sId);
  return vPeople.front();
}

std::vector<common::Person> PersonRepository::list() {
  std::lock_guard<std::mutex> lock(_mtx);

  auto rsResult = _sess.query("SELECT * FROM type::table($tb)", {{"tb", kTable}});
  rsResult.check();
  return rowsOf(firstSlot(rsResult).jResult);
}

std::vector<common::Person> PersonRepository::batchCreate(
    const std::vector<std::string>& vNames) {
  std::lock_guard<std::mutex> lock(_mtx);

  StatementBatch sbBatch(_spLog);
  for (const auto& sName : vNames) {
    sbBatch.add(std::string("CREATE ") + kTable + ":uuid() CONTENT { name: " +
                surql::quoteString(sName) + " }");
  }

  auto rsResult = sbBatch.execute(_sess);

  std::vector<common::Person> vCreated;
  vCreated.reserve(rsResult.size());
  for (const auto& srSlot : rsResult.slots()) {
    auto vPeople = rowsOf(srSlot.jResult);
    vCreated.insert(vCreated.end(), vPeople.begin(), vPeople.end());
  }
  _spLog->info("Batch created {} person record(s)", vCreated.size());
  return vCreated;
}

std::vector<common::Person> PersonRepository::deleteAll() {
  std::lock_guard<std::mutex> lock(_mtx);

  // Any failure before commit leaves the handle open; its destructor
  // cancels the transaction.
  auto tx = Transaction::begin(_sess, _spLog);
  auto rsResult = tx.query(std::string("DELETE ") + kTable + " RETURN BEFORE");
  rsResult.check();
  auto vDeleted = rowsOf(firstSlot(rsResult).jResult);
  tx.commit();

  _spLog->info("Batch deleted {} person record(s)", vDeleted.size());
  return vDeleted;
}

common::Person PersonRepository::fromRow(const nlohmann::json& jRow) {
  if (!jRow.is_object() || !jRow.contains("id")) {
    throw common::ExecutionError("Unexpected person row: " + jRow.dump());
  }

  common::Person pn;
  const auto& jId = jRow["id"];
  pn.sId = jId.is_string() ? jId.get<std::string>() : jId.dump();
  if (jRow.contains("name") && jRow["name"].is_string()) {
    pn.sName = jRow["name"].get<std::string>();
  }
  return pn;
}

std::vector<common::Person> PersonRepository::rowsOf(const nlohmann::json& jRows) const {
  std::vector<common::Person> vPeople;
  if (jRows.is_null()) return vPeople;
  if (jRows.is_object()) {
    vPeople.push_back(fromRow(jRows));
    return vPeople;
  }
  if (!jRows.is_array()) {
    throw common::ExecutionError("Unexpected result shape: " + jRows.dump());
  }
  for (const auto& jRow : jRows) {
    vPeople.push_back(fromRow(jRow));
  }
  return vPeople;
}

void PersonRepository::requireKey(const std::string& sKey) const {
  if (sKey.empty()) {
    throw common::ValidationError("invalid_id", "Person id must not be empty");
  }
}

}  // namespace sgw::dal
