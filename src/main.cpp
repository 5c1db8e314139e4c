#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "dal/PersonRepository.hpp"
#include "dal/WebSocketSession.hpp"

#include <openssl/crypto.h>

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = sgw::common::Config::load();

    auto spLog = sgw::common::Logger::init(cfgApp.sLogLevel);
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Open the database session ────────────────────────────────
    sgw::dal::SessionSettings ssSettings;
    ssSettings.sHost = cfgApp.sDbHost;
    ssSettings.iPort = cfgApp.iDbPort;
    ssSettings.sUser = cfgApp.sDbUser;
    ssSettings.sPassword = cfgApp.sDbPassword;
    ssSettings.sNamespace = cfgApp.sDbNamespace;
    ssSettings.sDatabase = cfgApp.sDbDatabase;
    ssSettings.bTls = cfgApp.bDbTls;
    ssSettings.durTimeout = std::chrono::seconds(cfgApp.iDbTimeoutSeconds);

    // Zero the password in Config after handoff
    OPENSSL_cleanse(cfgApp.sDbPassword.data(), cfgApp.sDbPassword.size());
    cfgApp.sDbPassword.clear();

    auto upSession = std::make_unique<sgw::dal::WebSocketSession>(std::move(ssSettings), spLog);
    upSession->connect();
    spLog->info("Step 2: Database session established ({}:{})", cfgApp.sDbHost,
                cfgApp.iDbPort);

    // ── Step 3: Repository and routes ────────────────────────────────────
    auto prRepo = std::make_unique<sgw::dal::PersonRepository>(*upSession, spLog);
    auto upServer = std::make_unique<sgw::api::ApiServer>(*prRepo, spLog);
    upServer->registerRoutes();
    spLog->info("Step 3: API routes registered");

    // ── Step 4: HTTP server ──────────────────────────────────────────────
    spLog->info("surreal-gateway ready");
    upServer->start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    // Graceful shutdown
    upSession->close();
    spLog->info("surreal-gateway stopped");

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
