#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sso::common {

namespace {

void requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMin) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

void requireInRange(const char* pVarName, int iValue, int iMin, int iMax) {
  if (iValue < iMin || iValue > iMax) {
    throw std::runtime_error(std::string(pVarName) + " must be between " +
                             std::to_string(iMin) + " and " + std::to_string(iMax) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nParsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nParsed);
  } catch (const std::logic_error&) {
    nParsed = 0;
  }
  if (nParsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("SSO_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable SSO_DB_URL is not set");
  }
  cfg.sJwtSecret = loadSecret("SSO_JWT_SECRET");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("SSO_DB_POOL_SIZE", 10);

  const std::string sAlgorithm = getEnv("SSO_JWT_ALGORITHM");
  if (!sAlgorithm.empty()) {
    cfg.sJwtAlgorithm = sAlgorithm;
  }
  cfg.iTokenTtlSeconds = getEnvInt("SSO_TOKEN_TTL_SECONDS", 86400);

  cfg.iHttpPort = getEnvInt("SSO_HTTP_PORT", 3000);
  cfg.iHttpThreads = getEnvInt("SSO_HTTP_THREADS", 4);

  const std::string sLogLevel = getEnv("SSO_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  const std::string sBackend = getEnv("SSO_SESSION_BACKEND");
  if (!sBackend.empty()) {
    cfg.sSessionBackend = sBackend;
  }
  cfg.iSessionSweepIntervalSeconds = getEnvInt("SSO_SESSION_SWEEP_INTERVAL_SECONDS", 3600);
  cfg.iRevokedRetentionSeconds = getEnvInt("SSO_REVOKED_RETENTION_SECONDS", 86400);

  // ── Validation ─────────────────────────────────────────────────────────
  requireAtLeast("SSO_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("SSO_TOKEN_TTL_SECONDS", cfg.iTokenTtlSeconds, 1);
  requireInRange("SSO_HTTP_PORT", cfg.iHttpPort, 1, 65535);
  requireAtLeast("SSO_HTTP_THREADS", cfg.iHttpThreads, 1);
  requireAtLeast("SSO_SESSION_SWEEP_INTERVAL_SECONDS", cfg.iSessionSweepIntervalSeconds, 1);
  requireAtLeast("SSO_REVOKED_RETENTION_SECONDS", cfg.iRevokedRetentionSeconds, 0);

  if (cfg.sSessionBackend != "memory" && cfg.sSessionBackend != "postgres") {
    throw std::runtime_error("SSO_SESSION_BACKEND must be 'memory' or 'postgres' (got '" +
                             cfg.sSessionBackend + "')");
  }

  return cfg;
}

}  // namespace sso::common
