#include "common/Config.hpp"

#include "common/Logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ustore::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }

  size_t nConsumed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nConsumed);
  } catch (const std::logic_error&) {
    nConsumed = 0;
  }
  if (nConsumed == 0 || nConsumed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

Config Config::load() {
  Config cfg;

  cfg.sDbUrl = getEnv("USTORE_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable USTORE_DB_URL is not set");
  }

  cfg.iDbPoolSize = getEnvInt("USTORE_DB_POOL_SIZE", 1);
  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error(
        "USTORE_DB_POOL_SIZE must be >= 1 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }

  const std::string sLogLevel = getEnv("USTORE_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    Logger::parseLevel(sLogLevel);
    cfg.sLogLevel = sLogLevel;
  }

  return cfg;
}

}  // namespace ustore::common
