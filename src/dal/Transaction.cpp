#include "dal/Transaction.hpp"

#include "common/Errors.hpp"

#include <utility>

namespace sgw::dal {

namespace {

const char* const kBeginMarker = "BEGIN TRANSACTION;";
const char* const kCommitMarker = "COMMIT TRANSACTION;";
const char* const kCancelMarker = "CANCEL TRANSACTION;";

const char* phaseName(common::TxPhase phase) {
  switch (phase) {
    case common::TxPhase::Begin: return "begin";
    case common::TxPhase::Query: return "query";
    case common::TxPhase::Execute: return "execute";
    case common::TxPhase::Commit: return "commit";
    case common::TxPhase::Rollback: return "rollback";
  }
  return "unknown";
}

/// Submit a transaction marker and check its result slots.
/// Rethrows session failures as TxError / IndeterminateOutcomeError tagged
/// with the given phase.
void submitMarker(ISession& sess, const char* pMarker, common::TxPhase phase) {
  ResultSet rsResult;
  try {
    rsResult = sess.query(pMarker);
  } catch (const common::IndeterminateOutcomeError& e) {
    throw common::IndeterminateOutcomeError(phase, e.what());
  } catch (const common::ExecutionError& e) {
    throw common::TxError(phase, std::string(phaseName(phase)) + " failed: " + e.what(),
                          e._sEngineMessage);
  }

  for (const auto& srSlot : rsResult.slots()) {
    if (!srSlot.isOk()) {
      const std::string sEngine = srSlot.errorMessage();
      throw common::TxError(phase, std::string(phaseName(phase)) + " failed: " + sEngine,
                            sEngine);
    }
  }
}

}  // namespace

const char* toString(TxState state) {
  switch (state) {
    case TxState::Unopened: return "unopened";
    case TxState::Open: return "open";
    case TxState::Committed: return "committed";
    case TxState::RolledBack: return "rolled back";
    case TxState::Failed: return "failed";
  }
  return "unknown";
}

Transaction::Transaction(ISession& sess, std::shared_ptr<spdlog::logger> spLog)
    : _pSession(&sess), _spLog(std::move(spLog)) {}

Transaction Transaction::begin(ISession& sess, std::shared_ptr<spdlog::logger> spLog) {
  Transaction tx(sess, std::move(spLog));
  submitMarker(sess, kBeginMarker, common::TxPhase::Begin);
  tx._state = TxState::Open;
  tx._spLog->debug("transaction opened");
  return tx;
}

Transaction::~Transaction() {
  if (_state != TxState::Open) return;

  _spLog->warn("transaction dropped while open, rolling back");
  try {
    rollback();
  } catch (const std::exception& e) {
    _spLog->error("rollback of dropped transaction failed: {}", e.what());
  }
}

Transaction::Transaction(Transaction&& other) noexcept
    : _pSession(other._pSession),
      _spLog(std::move(other._spLog)),
      _state(other._state) {
  other._pSession = nullptr;
  other._state = TxState::Unopened;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
  if (this != &other) {
    if (_state == TxState::Open) {
      try {
        rollback();
      } catch (const std::exception& e) {
        _spLog->error("rollback of replaced transaction failed: {}", e.what());
      }
    }
    _pSession = other._pSession;
    _spLog = std::move(other._spLog);
    _state = other._state;
    other._pSession = nullptr;
    other._state = TxState::Unopened;
  }
  return *this;
}

void Transaction::commit() {
  requireOpen("commit");
  finish(kCommitMarker, common::TxPhase::Commit, TxState::Committed);
  _spLog->debug("transaction committed");
}

void Transaction::rollback() {
  requireOpen("rollback");
  finish(kCancelMarker, common::TxPhase::Rollback, TxState::RolledBack);
  _spLog->debug("transaction rolled back");
}

ResultSet Transaction::query(const std::string& sScript, const nlohmann::json& jVars) {
  requireOpen("query");
  try {
    return _pSession->query(sScript, jVars);
  } catch (const common::IndeterminateOutcomeError& e) {
    // The session dropped its connection; the engine discards the
    // transaction with it.
    _state = TxState::Failed;
    _spLog->error("transaction query interrupted: {}", e.what());
    throw;
  }
}

void Transaction::finish(const char* pMarker, common::TxPhase phase, TxState stDone) {
  try {
    submitMarker(*_pSession, pMarker, phase);
  } catch (const common::TxError& e) {
    _state = TxState::Failed;
    _spLog->error("transaction {} failed: {}", phaseName(phase), e.what());
    throw;
  }
  _state = stDone;
}

void Transaction::requireOpen(const char* pOperation) const {
  if (_state != TxState::Open) {
    throw common::StateViolation(std::string("Cannot ") + pOperation +
                                 " a transaction that is " + toString(_state));
  }
}

}  // namespace sgw::dal
