#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sgw::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvOr(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) return iDefault;

  std::size_t uPos = 0;
  try {
    const int iValue = std::stoi(sValue, &uPos);
    if (uPos == sValue.size()) return iValue;
  } catch (const std::logic_error&) {
    // falls through to the error below
  }
  throw std::runtime_error(std::string(pVarName) + " is not an integer: '" + sValue + "'");
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) return bDefault;
  if (sValue == "true" || sValue == "1" || sValue == "yes") return true;
  if (sValue == "false" || sValue == "0" || sValue == "no") return false;
  throw std::runtime_error(std::string(pVarName) + " must be true/false/1/0/yes/no (got '" +
                           sValue + "')");
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) return sValue;

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(std::string(pVarName) + " is required (or " + sFileVar +
                             " naming a file that holds it)");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs) {
    throw std::runtime_error("Cannot read " + sFileVar + " file: " + sFilePath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  const auto uLast = sValue.find_last_not_of(" \t\r\n");
  sValue.erase(uLast == std::string::npos ? 0 : uLast + 1);
  if (sValue.empty()) {
    throw std::runtime_error(sFileVar + " names an empty file: " + sFilePath);
  }
  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Database ───────────────────────────────────────────────────────────
  cfg.sDbHost = getEnvOr("SGW_DB_HOST", cfg.sDbHost);
  cfg.iDbPort = getEnvInt("SGW_DB_PORT", 8000);
  cfg.sDbUser = getEnvOr("SGW_DB_USER", cfg.sDbUser);
  cfg.sDbPassword = loadSecret("SGW_DB_PASSWORD");
  cfg.sDbNamespace = getEnvOr("SGW_DB_NAMESPACE", cfg.sDbNamespace);
  cfg.sDbDatabase = getEnvOr("SGW_DB_DATABASE", cfg.sDbDatabase);
  cfg.bDbTls = getEnvBool("SGW_DB_TLS", false);
  cfg.iDbTimeoutSeconds = getEnvInt("SGW_DB_TIMEOUT_SECONDS", 30);

  // ── HTTP ───────────────────────────────────────────────────────────────
  cfg.iHttpPort = getEnvInt("SGW_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("SGW_HTTP_THREADS", 4);

  // Logging
  cfg.sLogLevel = getEnvOr("SGW_LOG_LEVEL", cfg.sLogLevel);

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iDbPort < 1 || cfg.iDbPort > 65535) {
    throw std::runtime_error("SGW_DB_PORT must be in 1..65535 (got " +
                             std::to_string(cfg.iDbPort) + ")");
  }

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error("SGW_HTTP_PORT must be in 1..65535 (got " +
                             std::to_string(cfg.iHttpPort) + ")");
  }

  if (cfg.iHttpThreads < 1) {
    throw std::runtime_error("SGW_HTTP_THREADS must be >= 1 (got " +
                             std::to_string(cfg.iHttpThreads) + ")");
  }

  if (cfg.iDbTimeoutSeconds < 1) {
    throw std::runtime_error("SGW_DB_TIMEOUT_SECONDS must be >= 1 (got " +
                             std::to_string(cfg.iDbTimeoutSeconds) + ")");
  }

  return cfg;
}

}  // namespace sgw::common
