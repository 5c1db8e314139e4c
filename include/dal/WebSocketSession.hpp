#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dal/ISession.hpp"

namespace sgw::dal {

class IRpcChannel;

/// Connection parameters for a WebSocketSession.
/// Class abbreviation: ss
struct SessionSettings {
  std::string sHost = "localhost";
  int iPort = 8000;
  std::string sUser;
  std::string sPassword;
  std::string sNamespace;
  std::string sDatabase;
  bool bTls = false;
  std::chrono::seconds durTimeout{30};
};

/// ISession over SurrealDB's WebSocket RPC endpoint (ws[s]://host:port/rpc).
/// One logical connection; round-trips are serialized by an internal mutex.
/// A connection interrupted mid round-trip is dropped and re-established on
/// the next query.
/// Class abbreviation: ws
class WebSocketSession : public ISession {
 public:
  WebSocketSession(SessionSettings ssSettings, std::shared_ptr<spdlog::logger> spLog);
  ~WebSocketSession() override;

  WebSocketSession(const WebSocketSession&) = delete;
  WebSocketSession& operator=(const WebSocketSession&) = delete;

  /// Open the socket, sign in and select namespace/database.
  /// Throws ExecutionError on any failure.
  void connect();

  ResultSet query(const std::string& sScript,
                  const nlohmann::json& jVars = nlohmann::json::object()) override;

  /// Abort the round-trip in flight, if any. Safe to call from any thread.
  /// The interrupted call throws IndeterminateOutcomeError.
  void cancel();

  /// Close the connection. Further queries reconnect.
  void close();

  bool isConnected() const;

 private:
  /// Caller holds _mtx.
  void openLocked();
  nlohmann::json callLocked(const std::string& sMethod, nlohmann::json jParams);
  void dropLocked();

  SessionSettings _ssSettings;
  std::shared_ptr<spdlog::logger> _spLog;

  std::mutex _mtx;                      // one round-trip at a time
  mutable std::mutex _mtxChannel;       // guards _upChannel against cancel()
  std::unique_ptr<IRpcChannel> _upChannel;
  std::uint64_t _uNextId = 1;
};

}  // namespace sgw::dal
