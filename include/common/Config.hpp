#pragma once

#include <string>

namespace ustore::common {

/// Environment-driven settings for the user store.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  /// Storage location: a libpq connection string/URI, or ":memory:".
  std::string sDbUrl;

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 1;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all settings from USTORE_* environment variables.
  /// Throws std::runtime_error on a missing USTORE_DB_URL, a malformed
  /// integer, a pool size below 1 or an unknown log level.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace ustore::common
