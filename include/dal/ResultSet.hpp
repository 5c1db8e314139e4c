#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sgw::dal {

/// One slot of a result set: the outcome of a single submitted statement.
/// Class abbreviation: sr
struct StatementResult {
  std::string sStatus;     // "OK" or "ERR"
  std::string sTime;       // engine-reported execution time, e.g. "1.2ms"
  nlohmann::json jResult;  // rows on OK, error text on ERR

  bool isOk() const { return sStatus == "OK"; }

  /// Engine error text for an ERR slot; empty for OK slots.
  std::string errorMessage() const;
};

/// Positional, tagged outcome of a submitted script: one slot per statement.
/// Class abbreviation: rs
class ResultSet {
 public:
  ResultSet() = default;
  explicit ResultSet(std::vector<StatementResult> vSlots);

  /// Build from the engine's query reply: an array of
  /// {status, time, result} objects (older engines put ERR text in "detail").
  /// Throws ExecutionError if the reply does not have that shape.
  static ResultSet fromJson(const nlohmann::json& jReply);

  std::size_t size() const { return _vSlots.size(); }
  bool empty() const { return _vSlots.empty(); }

  /// Throws std::out_of_range for an invalid slot index.
  const StatementResult& at(std::size_t uSlot) const;

  const std::vector<StatementResult>& slots() const { return _vSlots; }

  /// True when every slot is OK.
  bool ok() const;

  /// Throw ExecutionError for the slot that caused the failure, if any.
  /// When a failed transaction marks every slot ERR, the slot carrying the
  /// root cause is reported rather than the first cascaded one.
  void check() const;

 private:
  std::vector<StatementResult> _vSlots;
};

}  // namespace sgw::dal
