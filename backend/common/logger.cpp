#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace common {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::kInfo;
std::function<void(LogLevel, const std::string&)> Logger::sink_;

namespace {

const char* levelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << millis;
  return oss.str();
}

} // namespace

void Logger::debug(const std::string& line) {
  if (level() > LogLevel::kDebug && std::getenv("WORKOUT_DEBUG") == nullptr) return;
  emit(LogLevel::kDebug, line);
}

void Logger::info(const std::string& line) {
  if (level() > LogLevel::kInfo) return;
  emit(LogLevel::kInfo, line);
}

void Logger::warn(const std::string& line) {
  if (level() > LogLevel::kWarn) return;
  emit(LogLevel::kWarn, line);
}

void Logger::error(const std::string& line) {
  emit(LogLevel::kError, line);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

bool Logger::setLevel(const std::string& name) {
  if (name == "debug") setLevel(LogLevel::kDebug);
  else if (name == "info") setLevel(LogLevel::kInfo);
  else if (name == "warn") setLevel(LogLevel::kWarn);
  else if (name == "error") setLevel(LogLevel::kError);
  else return false;
  return true;
}

LogLevel Logger::level() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void Logger::setSink(std::function<void(LogLevel, const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::emit(LogLevel level, const std::string& line) {
  std::string formatted = timestamp() + " [" + levelTag(level) + "] " + line;
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, formatted);
  }
  auto& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << formatted << '\n';
  out.flush();
}

} // namespace common
