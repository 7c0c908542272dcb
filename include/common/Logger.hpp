#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ustore::common {

/// Process-wide logging facade over spdlog's default logger. Writes to
/// stderr so that stdout carries only program output.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Saved user id={}", iId);
class Logger {
 public:
  /// Install the "ustore" stderr logger at the given level, or only change
  /// the level if it is already installed.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// Throws std::runtime_error on any other level name.
  static void init(const std::string& sLevel);

  /// Returns spdlog's default logger, installing it at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

  /// Parse a level name; throws std::runtime_error if it is not recognized.
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

 private:
  static bool _bInitialized;
};

}  // namespace ustore::common
