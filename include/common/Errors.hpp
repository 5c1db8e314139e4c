#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace sgw::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: input validation failures.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested entity does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: duplicate resource.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 400 Bad Request: a statement does not parse. Never reaches the network.
/// Carries the offending statement text and the byte offset of the failure.
struct ParseError : AppError {
  std::string _sStatement;
  std::size_t _uOffset;

  explicit ParseError(std::string sStatement, std::size_t uOffset, const std::string& sReason)
      : AppError(400, "parse_error",
                 "Cannot parse statement at offset " + std::to_string(uOffset) + ": " +
                     sReason),
        _sStatement(std::move(sStatement)),
        _uOffset(uOffset) {}
};

/// 502 Bad Gateway: the engine rejected or failed a submitted script.
/// _iSlot is the index of the failing result slot, or -1 when the failure
/// happened at the transport level.
struct ExecutionError : AppError {
  int _iSlot;
  std::string _sEngineMessage;

  explicit ExecutionError(std::string sMsg, int iSlot = -1, std::string sEngineMessage = {})
      : AppError(502, "execution_failed", std::move(sMsg)),
        _iSlot(iSlot),
        _sEngineMessage(std::move(sEngineMessage)) {}

 protected:
  ExecutionError(int iHttpStatus, std::string sCode, std::string sMsg, int iSlot,
                 std::string sEngineMessage)
      : AppError(iHttpStatus, std::move(sCode), std::move(sMsg)),
        _iSlot(iSlot),
        _sEngineMessage(std::move(sEngineMessage)) {}
};

/// Transaction boundary being submitted when a TxError was raised.
enum class TxPhase { Begin, Query, Execute, Commit, Rollback };

/// 502 Bad Gateway: a begin/commit/rollback marker failed.
struct TxError : ExecutionError {
  TxPhase _phase;

  explicit TxError(TxPhase phase, std::string sMsg, std::string sEngineMessage = {})
      : ExecutionError(502, "transaction_failed", std::move(sMsg), -1,
                       std::move(sEngineMessage)),
        _phase(phase) {}

 protected:
  TxError(int iHttpStatus, std::string sCode, TxPhase phase, std::string sMsg,
          std::string sEngineMessage)
      : ExecutionError(iHttpStatus, std::move(sCode), std::move(sMsg), -1,
                       std::move(sEngineMessage)),
        _phase(phase) {}
};

/// 504 Gateway Timeout: a round-trip was interrupted after the request left
/// the client (cancelled, timed out, connection lost). Whether the engine
/// applied it is unknown; re-query state before retrying.
struct IndeterminateOutcomeError : TxError {
  explicit IndeterminateOutcomeError(TxPhase phase, std::string sMsg)
      : TxError(504, "indeterminate_outcome", phase, std::move(sMsg), {}) {}
};

/// 500 Internal Server Error: commit/rollback/query on a handle that is not
/// open. A caller contract violation, not a runtime condition.
struct StateViolation : AppError {
  explicit StateViolation(std::string sMsg)
      : AppError(500, "transaction_state_violation", std::move(sMsg)) {}
};

}  // namespace sgw::common
