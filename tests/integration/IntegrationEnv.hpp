#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

#include "dal/WebSocketSession.hpp"

namespace sgw::test {

/// Session settings for the live engine named by SGW_TEST_DB_URL (host:port).
/// Returns false when the variable is unset. Credentials come from
/// SGW_TEST_DB_USER / SGW_TEST_DB_PASSWORD (default surreal / password).
inline bool integrationSettings(dal::SessionSettings& ssOut) {
  const char* pUrl = std::getenv("SGW_TEST_DB_URL");
  if (pUrl == nullptr || *pUrl == '\0') return false;

  const std::string sUrl(pUrl);
  const auto uColon = sUrl.rfind(':');
  ssOut.sHost = uColon == std::string::npos ? sUrl : sUrl.substr(0, uColon);
  ssOut.iPort = uColon == std::string::npos ? 8000 : std::stoi(sUrl.substr(uColon + 1));

  const char* pUser = std::getenv("SGW_TEST_DB_USER");
  const char* pPass = std::getenv("SGW_TEST_DB_PASSWORD");
  ssOut.sUser = pUser ? pUser : "surreal";
  ssOut.sPassword = pPass ? pPass : "password";
  ssOut.sNamespace = "sgw_test";
  ssOut.sDatabase = "sgw_test";
  ssOut.durTimeout = std::chrono::seconds(10);
  return true;
}

}  // namespace sgw::test
