/**
 * @file logging.cpp
 * @brief Global log level and stderr sink.
 */

#include "core/logging.h"

#include <atomic>
#include <iostream>

namespace dynamix {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warn)};

}  // namespace

void setLogLevel(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= g_log_level.load(std::memory_order_relaxed);
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
  }
  return "debug";
}

void writeLog(LogLevel level, const std::string& message, const char* file, int line) {
  const char* tag = logLevelName(level);
  size_t start = 0;
  while (start <= message.size()) {
    size_t end = message.find('\n', start);
    size_t len = (end == std::string::npos) ? message.size() - start : end - start;
    std::string text = message.substr(start, len);
    if (!text.empty() || message.empty()) {
      std::cerr << "[DynaMix][" << tag << "]";
      // Errors carry their source location
      if (level == LogLevel::Error) std::cerr << "[" << file << ":" << line << "]";
      std::cerr << " " << text << "\n";
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

}  // namespace dynamix
