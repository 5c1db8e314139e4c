#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "dal/ISession.hpp"
#include "dal/ResultSet.hpp"

namespace sgw::dal {

/// Ordered list of validated statements, executed as one composite
/// transaction script:
///
///   BEGIN TRANSACTION;
///   <stmt 1>;
///   ...
///   COMMIT TRANSACTION;
///
/// Not thread-safe; owned by the caller that builds it.
/// Class abbreviation: sb
class StatementBatch {
 public:
  explicit StatementBatch(std::shared_ptr<spdlog::logger> spLog);

  /// Parse sStatement and append its canonical form.
  /// Throws ParseError (list unchanged) when the text is not exactly one
  /// statement, or is a transaction marker.
  void add(const std::string& sStatement);

  /// Composite script for the current list. Pure.
  std::string render() const;

  /// Submit the composite script as one unit and wait for its result set.
  /// Clears the list on success. On failure the list is left untouched and
  /// ExecutionError (or IndeterminateOutcomeError) is thrown.
  /// An empty batch returns an empty ResultSet without a round-trip.
  ResultSet execute(ISession& sess);

  void clear();

  std::size_t size() const { return _vStatements.size(); }
  bool empty() const { return _vStatements.empty(); }
  const std::vector<std::string>& statements() const { return _vStatements; }

 private:
  std::shared_ptr<spdlog::logger> _spLog;
  std::vector<std::string> _vStatements;
};

}  // namespace sgw::dal
