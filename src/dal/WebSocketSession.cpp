#include "dal/WebSocketSession.hpp"

#include "common/Errors.hpp"

#include <atomic>
#include <optional>
#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>

namespace sgw::dal {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

/// Frame-level transport under a WebSocketSession. Every operation blocks up
/// to the given timeout and throws beast::system_error on failure.
/// Class abbreviation: rc
class IRpcChannel {
 public:
  virtual ~IRpcChannel() = default;

  virtual void open(const std::string& sHost, int iPort, std::chrono::seconds durTimeout) = 0;
  virtual void write(const std::string& sFrame, std::chrono::seconds durTimeout) = 0;
  virtual std::string read(std::chrono::seconds durTimeout) = 0;

  /// Abort the operation in flight. Thread-safe.
  virtual void cancel() = 0;

  virtual void close(std::chrono::seconds durTimeout) = 0;
};

namespace {

/// Beast websocket over plain TCP (kTls = false) or TLS (kTls = true).
/// Asynchronous operations are driven to completion on a private io_context
/// so that timeouts and cross-thread cancellation work the same way for
/// every step.
template <bool kTls>
class BasicChannel : public IRpcChannel {
  using NextLayer =
      std::conditional_t<kTls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
  using Stream = websocket::stream<NextLayer>;

 public:
  BasicChannel() : _sslCtx(ssl::context::tls_client) {
    if constexpr (kTls) {
      _sslCtx.set_default_verify_paths();
      _sslCtx.set_verify_mode(ssl::verify_peer);
    }
  }

  void open(const std::string& sHost, int iPort, std::chrono::seconds durTimeout) override {
    if constexpr (kTls) {
      _oStream.emplace(_ioc, _sslCtx);
    } else {
      _oStream.emplace(_ioc);
    }

    beast::error_code ec;
    bool bDone = false;

    tcp::resolver resolver(_ioc);
    tcp::resolver::results_type results;
    resolver.async_resolve(sHost, std::to_string(iPort),
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                             ec = e;
                             results = std::move(r);
                             bDone = true;
                           });
    await(durTimeout, bDone, [&resolver] { resolver.cancel(); });
    if (ec) throw beast::system_error(ec);

    bDone = false;
    beast::get_lowest_layer(*_oStream).async_connect(
        results, [&](beast::error_code e, const tcp::endpoint&) {
          ec = e;
          bDone = true;
        });
    await(durTimeout, bDone);
    if (ec) throw beast::system_error(ec);

    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(_oStream->next_layer().native_handle(), sHost.c_str())) {
        throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                    net::error::get_ssl_category()));
      }
      _oStream->next_layer().set_verify_callback(ssl::host_name_verification(sHost));
      bDone = false;
      _oStream->next_layer().async_handshake(ssl::stream_base::client,
                                             [&](beast::error_code e) {
                                               ec = e;
                                               bDone = true;
                                             });
      await(durTimeout, bDone);
      if (ec) throw beast::system_error(ec);
    }

    // The websocket layer manages its own idle/keepalive timers.
    beast::get_lowest_layer(*_oStream).expires_never();
    _oStream->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    _oStream->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, "surreal-gateway");
      req.set(beast::http::field::sec_websocket_protocol, "json");
    }));

    bDone = false;
    _oStream->async_handshake(sHost + ":" + std::to_string(iPort), "/rpc",
                              [&](beast::error_code e) {
                                ec = e;
                                bDone = true;
                              });
    await(durTimeout, bDone);
    if (ec) throw beast::system_error(ec);

    _oStream->text(true);
  }

  void write(const std::string& sFrame, std::chrono::seconds durTimeout) override {
    beast::error_code ec;
    bool bDone = false;
    _oStream->async_write(net::buffer(sFrame), [&](beast::error_code e, std::size_t) {
      ec = e;
      bDone = true;
    });
    await(durTimeout, bDone);
    if (ec) throw beast::system_error(ec);
  }

  std::string read(std::chrono::seconds durTimeout) override {
    beast::flat_buffer buf;
    beast::error_code ec;
    bool bDone = false;
    _oStream->async_read(buf, [&](beast::error_code e, std::size_t) {
      ec = e;
      bDone = true;
    });
    await(durTimeout, bDone);
    if (ec) throw beast::system_error(ec);
    return beast::buffers_to_string(buf.data());
  }

  void cancel() override {
    const std::uint64_t uGeneration = _uGeneration.load();
    net::post(_ioc, [this, uGeneration] {
      if (uGeneration == _uGeneration.load()) abortSocket();
    });
  }

  void close(std::chrono::seconds durTimeout) override {
    if (!_oStream || !_oStream->is_open()) return;
    beast::error_code ec;
    bool bDone = false;
    _oStream->async_close(websocket::close_code::normal, [&](beast::error_code e) {
      ec = e;
      bDone = true;
    });
    await(durTimeout, bDone);
    if (ec) throw beast::system_error(ec);
  }

 private:
  void abortSocket() {
    if (!_oStream) return;
    beast::error_code ecIgnored;
    beast::get_lowest_layer(*_oStream).socket().cancel(ecIgnored);
  }

  /// Run the io_context until bDone is set or the timeout expires. On
  /// timeout the pending operation is aborted and timed_out is thrown.
  template <typename OnAbort>
  void await(std::chrono::seconds durTimeout, const bool& bDone, OnAbort fnAbort) {
    ++_uGeneration;
    _ioc.restart();
    _ioc.run_for(durTimeout);
    if (bDone) return;

    fnAbort();
    _ioc.restart();
    while (!bDone && _ioc.run_one() > 0) {
    }
    throw beast::system_error(net::error::timed_out);
  }

  void await(std::chrono::seconds durTimeout, const bool& bDone) {
    await(durTimeout, bDone, [this] { abortSocket(); });
  }

  net::io_context _ioc;
  ssl::context _sslCtx;
  std::optional<Stream> _oStream;
  std::atomic<std::uint64_t> _uGeneration{0};
};

std::unique_ptr<IRpcChannel> makeChannel(bool bTls) {
  if (bTls) return std::make_unique<BasicChannel<true>>();
  return std::make_unique<BasicChannel<false>>();
}

}  // namespace

WebSocketSession::WebSocketSession(SessionSettings ssSettings,
                                   std::shared_ptr<spdlog::logger> spLog)
    : _ssSettings(std::move(ssSettings)), _spLog(std::move(spLog)) {}

WebSocketSession::~WebSocketSession() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_upChannel) {
      try {
        _upChannel->close(_ssSettings.durTimeout);
      } catch (const beast::system_error& e) {
        _spLog->warn("Closing database connection failed: {}", e.what());
      }
      dropLocked();
    }
  }
  OPENSSL_cleanse(_ssSettings.sPassword.data(), _ssSettings.sPassword.size());
}

void WebSocketSession::connect() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_upChannel) return;
  openLocked();
}

ResultSet WebSocketSession::query(const std::string& sScript, const nlohmann::json& jVars) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_upChannel) {
    _spLog->warn("Database connection is down, reconnecting to {}:{}", _ssSettings.sHost,
                 _ssSettings.iPort);
    openLocked();
  }

  _spLog->debug("query: {}", sScript);
  auto jResult = callLocked("query", nlohmann::json::array({sScript, jVars}));
  return ResultSet::fromJson(jResult);
}

void WebSocketSession::cancel() {
  std::lock_guard<std::mutex> lock(_mtxChannel);
  if (_upChannel) {
    _spLog->info("Cancelling in-flight database round-trip");
    _upChannel->cancel();
  }
}

void WebSocketSession::close() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_upChannel) return;
  try {
    _upChannel->close(_ssSettings.durTimeout);
  } catch (const beast::system_error& e) {
    _spLog->warn("Closing database connection failed: {}", e.what());
  }
  dropLocked();
  _spLog->info("Database connection closed");
}

bool WebSocketSession::isConnected() const {
  std::lock_guard<std::mutex> lock(_mtxChannel);
  return _upChannel != nullptr;
}

void WebSocketSession::openLocked() {
  const std::string sScheme = _ssSettings.bTls ? "wss" : "ws";
  _spLog->info("Connecting to {}://{}:{}/rpc", sScheme, _ssSettings.sHost, _ssSettings.iPort);

  {
    std::lock_guard<std::mutex> lock(_mtxChannel);
    _upChannel = makeChannel(_ssSettings.bTls);
  }

  try {
    _upChannel->open(_ssSettings.sHost, _ssSettings.iPort, _ssSettings.durTimeout);
  } catch (const beast::system_error& e) {
    dropLocked();
    throw common::ExecutionError("Cannot connect to " + _ssSettings.sHost + ":" +
                                 std::to_string(_ssSettings.iPort) + ": " + e.what());
  }

  try {
    callLocked("signin", nlohmann::json::array(
                             {{{"user", _ssSettings.sUser}, {"pass", _ssSettings.sPassword}}}));
    callLocked("use",
               nlohmann::json::array({_ssSettings.sNamespace, _ssSettings.sDatabase}));
  } catch (const common::ExecutionError& e) {
    // signin and use are idempotent, so an interrupted handshake is a
    // plain connection failure.
    dropLocked();
    throw common::ExecutionError(std::string("Cannot open database session: ") + e.what(), -1,
                                 e._sEngineMessage);
  }

  _spLog->info("Database session ready (ns={}, db={})", _ssSettings.sNamespace,
               _ssSettings.sDatabase);
}

nlohmann::json WebSocketSession::callLocked(const std::string& sMethod,
                                            nlohmann::json jParams) {
  const std::string sId = std::to_string(_uNextId++);

  std::string sFrame;
  try {
    nlohmann::json jRequest = {{"id", sId}, {"method", sMethod}, {"params", std::move(jParams)}};
    sFrame = jRequest.dump();
  } catch (const nlohmann::json::exception& e) {
    throw common::ExecutionError("Cannot encode '" + sMethod + "' request: " + e.what());
  }

  try {
    _upChannel->write(sFrame, _ssSettings.durTimeout);
  } catch (const beast::system_error& e) {
    dropLocked();
    throw common::IndeterminateOutcomeError(
        common::TxPhase::Query, "Sending '" + sMethod + "' request failed: " + e.what());
  }

  while (true) {
    std::string sReply;
    try {
      sReply = _upChannel->read(_ssSettings.durTimeout);
    } catch (const beast::system_error& e) {
      dropLocked();
      throw common::IndeterminateOutcomeError(
          common::TxPhase::Query, "No reply to '" + sMethod + "' request: " + e.what());
    }

    auto jReply = nlohmann::json::parse(sReply, nullptr, false);
    if (jReply.is_discarded() || !jReply.is_object()) {
      dropLocked();
      throw common::IndeterminateOutcomeError(common::TxPhase::Query,
                                              "Malformed reply to '" + sMethod + "' request");
    }

    if (!jReply.contains("id") || jReply["id"] != nlohmann::json(sId)) {
      _spLog->debug("Skipping unsolicited frame: {}", sReply);
      continue;
    }

    if (jReply.contains("error")) {
      const auto& jErr = jReply["error"];
      std::string sMessage = jErr.dump();
      if (jErr.is_object() && jErr.contains("message") && jErr["message"].is_string()) {
        sMessage = jErr["message"].get<std::string>();
      }
      _spLog->warn("RPC '{}' rejected: {}", sMethod, sMessage);
      throw common::ExecutionError("RPC '" + sMethod + "' failed: " + sMessage, -1, sMessage);
    }

    if (!jReply.contains("result")) {
      dropLocked();
      throw common::IndeterminateOutcomeError(
          common::TxPhase::Query, "Reply to '" + sMethod + "' request carries no result");
    }
    return jReply["result"];
  }
}

void WebSocketSession::dropLocked() {
  std::lock_guard<std::mutex> lock(_mtxChannel);
  _upChannel.reset();
}

}  // namespace sgw::dal
