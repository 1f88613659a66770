/**
 * @file logging.h
 * @brief Leveled diagnostic logging to stderr.
 *
 * Level policy:
 * - Error: the requested operation could not be completed.
 * - Warn: a track or input was skipped, or a fallback was taken.
 * - Info: lifecycle summaries (tracks loaded, batch totals).
 * - Debug: per-candidate traces.
 *
 * Messages below the global verbosity are not formatted.
 *
 * @code
 * DYNAMIX_LOG_WARN("skipping " << path << ": " << reader.getError());
 * DYNAMIX_LOG_DEBUG_STREAM() << "cue " << cue.time;
 * @endcode
 */

#ifndef DYNAMIX_CORE_LOGGING_H
#define DYNAMIX_CORE_LOGGING_H

#include <sstream>
#include <string>

namespace dynamix {

/// @brief Log verbosity, ordered from least to most verbose.
enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// @brief Set the process-wide verbosity (default: Warn).
void setLogLevel(LogLevel level);

/// @brief Get the process-wide verbosity.
LogLevel getLogLevel();

/// @brief True if messages at this level are currently emitted.
bool shouldLog(LogLevel level);

/// @brief Write one message (split on newlines) to stderr.
void writeLog(LogLevel level, const std::string& message, const char* file, int line);

/// @brief Lower-case level tag ("error", "warn", "info", "debug").
const char* logLevelName(LogLevel level);

/// @brief Stream-style logger that emits on destruction.
class LogStream {
 public:
  LogStream(LogLevel level, const char* file, int line)
      : level_(level), file_(file), line_(line), enabled_(shouldLog(level)) {}

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  ~LogStream() {
    if (enabled_) writeLog(level_, stream_.str(), file_, line_);
  }

  template <typename T>
  LogStream& operator<<(const T& value) {
    if (enabled_) stream_ << value;
    return *this;
  }

 private:
  LogLevel level_;
  const char* file_;
  int line_;
  bool enabled_;
  std::ostringstream stream_;
};

}  // namespace dynamix

#define DYNAMIX_LOG(level, message)                                   \
  do {                                                                \
    if (::dynamix::shouldLog(level)) {                                \
      std::ostringstream dynamix_log_stream_;                         \
      dynamix_log_stream_ << message;                                 \
      ::dynamix::writeLog(level, dynamix_log_stream_.str(), __FILE__, \
                          __LINE__);                                  \
    }                                                                 \
  } while (0)

#define DYNAMIX_LOG_ERROR(message) DYNAMIX_LOG(::dynamix::LogLevel::Error, message)
#define DYNAMIX_LOG_WARN(message) DYNAMIX_LOG(::dynamix::LogLevel::Warn, message)
#define DYNAMIX_LOG_INFO(message) DYNAMIX_LOG(::dynamix::LogLevel::Info, message)
#define DYNAMIX_LOG_DEBUG(message) DYNAMIX_LOG(::dynamix::LogLevel::Debug, message)

#define DYNAMIX_LOG_STREAM(level) ::dynamix::LogStream(level, __FILE__, __LINE__)
#define DYNAMIX_LOG_DEBUG_STREAM() DYNAMIX_LOG_STREAM(::dynamix::LogLevel::Debug)

#endif  // DYNAMIX_CORE_LOGGING_H
