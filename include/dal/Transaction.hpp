#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/Errors.hpp"
#include "dal/ISession.hpp"
#include "dal/ResultSet.hpp"

namespace sgw::dal {

/// Lifecycle of a Transaction handle.
///   Unopened -> Open -> { Committed, RolledBack, Failed }
enum class TxState { Unopened, Open, Committed, RolledBack, Failed };

const char* toString(TxState state);

/// Explicitly scoped atomic unit of work on a borrowed session.
/// The session must outlive the handle. A handle destroyed while still open
/// rolls back; failures there are logged, never thrown.
/// Move-only; a moved-from handle is Unopened.
/// Class abbreviation: tx
class Transaction {
 public:
  /// Submit BEGIN TRANSACTION and return an open handle.
  /// Throws TxError (phase Begin) on failure.
  static Transaction begin(ISession& sess, std::shared_ptr<spdlog::logger> spLog);

  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&& other) noexcept;
  Transaction& operator=(Transaction&& other) noexcept;

  /// Submit COMMIT TRANSACTION. Throws StateViolation unless Open; on failure
  /// the handle becomes Failed and TxError (phase Commit) is thrown.
  void commit();

  /// Submit CANCEL TRANSACTION. Throws StateViolation unless Open; on failure
  /// the handle becomes Failed and TxError (phase Rollback) is thrown.
  void rollback();

  /// Run a script on the bound session inside the transaction.
  /// Throws StateViolation unless Open. ERR slots come back unchecked.
  ResultSet query(const std::string& sScript,
                  const nlohmann::json& jVars = nlohmann::json::object());

  TxState state() const { return _state; }
  bool isOpen() const { return _state == TxState::Open; }

 private:
  Transaction(ISession& sess, std::shared_ptr<spdlog::logger> spLog);

  void finish(const char* pMarker, common::TxPhase phase, TxState stDone);
  void requireOpen(const char* pOperation) const;

  ISession* _pSession = nullptr;
  std::shared_ptr<spdlog::logger> _spLog;
  TxState _state = TxState::Unopened;
};

}  // namespace sgw::dal
