#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace common {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

// Thread-safe line logger. Each call writes one complete line under a single
// mutex so the download workers, the stderr drainers and the HTTP threads never
// interleave.
//
// debug/info -> stdout, warn/error -> stderr.
// Debug lines are emitted when the level is kDebug or WORKOUT_DEBUG is set.
class Logger {
public:
  static void debug(const std::string& line);
  static void info(const std::string& line);
  static void warn(const std::string& line);
  static void error(const std::string& line);

  static void setLevel(LogLevel level);
  // Accepts "debug", "info", "warn" or "error"; anything else keeps the level.
  static bool setLevel(const std::string& name);
  static LogLevel level();

  // Test-only: receives every emitted line (already formatted). nullptr clears.
  static void setSink(std::function<void(LogLevel, const std::string&)> sink);

private:
  static void emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static LogLevel level_;
  static std::function<void(LogLevel, const std::string&)> sink_;
};

} // namespace common
