#include "dal/StatementBatch.hpp"

#include "common/Errors.hpp"
#include "surql/Parser.hpp"

namespace sgw::dal {

namespace {

const char* const kBegin = "BEGIN TRANSACTION;\n";
const char* const kCommit = "COMMIT TRANSACTION;";

}  // namespace

StatementBatch::StatementBatch(std::shared_ptr<spdlog::logger> spLog)
    : _spLog(std::move(spLog)) {}

void StatementBatch::add(const std::string& sStatement) {
  auto upStmt = surql::parse(sStatement);
  if (upStmt->isTransactionControl()) {
    throw common::ParseError(sStatement, 0,
                             "transaction markers are added by the batch itself");
  }

  std::string sCanonical = upStmt->toSql();
  _spLog->debug("batch add #{}: {}", _vStatements.size() + 1, sCanonical);
  _vStatements.push_back(std::move(sCanonical));
}

std::string StatementBatch::render() const {
  std::string sScript = kBegin;
  for (const auto& sStmt : _vStatements) {
    sScript += sStmt;
    sScript += ";\n";
  }
  sScript += kCommit;
  return sScript;
}

ResultSet StatementBatch::execute(ISession& sess) {
  if (_vStatements.empty()) {
    _spLog->debug("batch execute: nothing to submit");
    return ResultSet{};
  }

  const std::string sScript = render();
  _spLog->debug("batch execute: {} statement(s)", _vStatements.size());

  ResultSet rsResult;
  try {
    rsResult = sess.query(sScript);
  } catch (const common::IndeterminateOutcomeError& e) {
    _spLog->error("batch execute interrupted: {}", e.what());
    throw common::IndeterminateOutcomeError(common::TxPhase::Execute, e.what());
  }

  try {
    rsResult.check();
  } catch (const common::ExecutionError& e) {
    _spLog->warn("batch execute failed: {}", e.what());
    throw;
  }

  _vStatements.clear();
  return rsResult;
}

void StatementBatch::clear() { _vStatements.clear(); }

}  // namespace sgw::dal
