#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/StringUtil.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sessiondb::common {

namespace {

void requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw ConfigurationError(
        "invalid_configuration",
        std::string(pVarName) + " must be >= " + std::to_string(iMin) + " (got " +
            std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::optional<int> Config::getEnvInt(const char* pVarName) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return std::nullopt;
  }
  try {
    size_t nPos = 0;
    int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw ConfigurationError(
        "invalid_configuration",
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::loadWithFileFallback(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigurationError(
        "invalid_configuration",
        "Cannot open file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }
  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = loadWithFileFallback("SESSIONDB_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw ConfigurationError(
        "invalid_configuration",
        "Required environment variable SESSIONDB_DB_URL (or SESSIONDB_DB_URL_FILE) is not set");
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("SESSIONDB_DB_POOL_SIZE").value_or(cfg.iDbPoolSize);
  cfg.iDbCheckoutTimeoutSeconds =
      getEnvInt("SESSIONDB_DB_CHECKOUT_TIMEOUT_SECONDS").value_or(cfg.iDbCheckoutTimeoutSeconds);

  if (const char* pTable = std::getenv("SESSIONDB_TABLE_NAME"); pTable != nullptr) {
    cfg.sTableName = trim(pTable);
    if (cfg.sTableName.empty()) {
      throw ConfigurationError("invalid_configuration",
                               "SESSIONDB_TABLE_NAME must not be empty");
    }
  }

  cfg.oDefaultMaxInactiveIntervalSeconds =
      getEnvInt("SESSIONDB_DEFAULT_MAX_INACTIVE_INTERVAL_SECONDS");
  cfg.iCleanupIntervalSeconds =
      getEnvInt("SESSIONDB_CLEANUP_INTERVAL_SECONDS").value_or(cfg.iCleanupIntervalSeconds);

  const std::string sLogLevel = getEnv("SESSIONDB_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────
  requireAtLeast("SESSIONDB_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("SESSIONDB_DB_CHECKOUT_TIMEOUT_SECONDS", cfg.iDbCheckoutTimeoutSeconds, 1);
  requireAtLeast("SESSIONDB_CLEANUP_INTERVAL_SECONDS", cfg.iCleanupIntervalSeconds, 1);

  return cfg;
}

}  // namespace sessiondb::common
