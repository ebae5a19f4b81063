#pragma once

#include <string>

namespace sso::common {

/// Environment variable loader.
/// Loads all SSO_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  std::string sJwtSecret;   // raw secret (zeroed after handoff to IJwtSigner)

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 10;

  // ── Tokens ────────────────────────────────────────────────────────────
  std::string sJwtAlgorithm = "HS256";
  int iTokenTtlSeconds = 86400;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 3000;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Sessions ──────────────────────────────────────────────────────────
  std::string sSessionBackend = "memory";  // "memory" | "postgres"
  int iSessionSweepIntervalSeconds = 3600;
  int iRevokedRetentionSeconds = 86400;

  /// Load and validate all config from environment variables.
  /// SSO_JWT_SECRET falls back to the file named by SSO_JWT_SECRET_FILE.
  /// Throws std::runtime_error on missing required vars or invalid values.
  static Config load();

 private:
  /// Read an env var with _FILE fallback for secrets.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace sso::common
