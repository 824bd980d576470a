#pragma once

#include <optional>
#include <string>

namespace sessiondb::common {

/// Environment variable loader for the session store daemon.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Database ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  int iDbPoolSize = 4;
  int iDbCheckoutTimeoutSeconds = 30;

  // ── Session store ─────────────────────────────────────────────────────
  std::string sTableName = "SESSION_STORE";
  std::optional<int> oDefaultMaxInactiveIntervalSeconds;

  // ── Expiry sweep ──────────────────────────────────────────────────────
  int iCleanupIntervalSeconds = 60;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// SESSIONDB_DB_URL falls back to the file named by SESSIONDB_DB_URL_FILE.
  /// Throws ConfigurationError on missing required vars or invalid values.
  static Config load();

 private:
  /// Read an env var with _FILE fallback.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadWithFileFallback(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int. Returns nullopt if unset.
  static std::optional<int> getEnvInt(const char* pVarName);
};

}  // namespace sessiondb::common
