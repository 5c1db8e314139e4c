#pragma once

#include <string>

namespace sgw::common {

/// Environment variable loader.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Database ──────────────────────────────────────────────────────────
  std::string sDbHost = "localhost";
  int iDbPort = 8000;
  std::string sDbUser = "surreal";
  std::string sDbPassword;  // required (zeroed after handoff to the session)
  std::string sDbNamespace = "namespace";
  std::string sDbDatabase = "database";
  bool bDbTls = false;
  int iDbTimeoutSeconds = 30;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for SGW_DB_PASSWORD.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, return sDefault if unset or empty.
  static std::string getEnvOr(const char* pVarName, const std::string& sDefault);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0/yes/no). Throws on anything else.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace sgw::common
