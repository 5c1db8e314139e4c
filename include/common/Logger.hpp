#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sgw::common {

/// Thin wrapper over spdlog for structured logging.
/// init() is called once by main; the returned logger is passed explicitly
/// to every component that logs.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   auto spLog = Logger::init("debug");
///   StatementBatch sbBatch(spLog);
class Logger {
 public:
  /// Create the process logger with the given level string and install it
  /// as spdlog's default. Re-initialization only updates the level.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static std::shared_ptr<spdlog::logger> init(const std::string& sLevel);

  /// Logger that discards everything. Used by tests and optional wiring.
  static std::shared_ptr<spdlog::logger> null();
};

}  // namespace sgw::common
