#pragma once

#include <string_view>

namespace cellforge::core {

// Levels as cellforge uses them:
//   Debug  one summary line per rendered frame (size, mode, executor)
//   Info   CLI progress (files written, presets saved)
//   Warn   rejected kernel configuration, ignored config entries
//   Error  panics
// The CLI starts at Info; --verbose lowers it to Debug, --log picks any level.
enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

// Process-wide threshold; messages below it are dropped before any sink sees them.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Parse "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parseLogLevel(std::string_view text, LogLevel& out);

// Extra destination for log lines, used by the tests to capture kernel warnings.
// Called after the stderr write; the string views die when the callback returns.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// Sinks are matched by (fn, user). Adding the same pair twice delivers twice.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes "[hh:mm:ss.mmm][LEVEL] message" to stderr. Worker threads of a JobExecutor
// may call this concurrently; lines are never interleaved.
void log(LogLevel level, std::string_view message);

} // namespace cellforge::core

#define CELLFORGE_LOG_TRACE(msg) ::cellforge::core::log(::cellforge::core::LogLevel::Trace, (msg))
#define CELLFORGE_LOG_DEBUG(msg) ::cellforge::core::log(::cellforge::core::LogLevel::Debug, (msg))
#define CELLFORGE_LOG_INFO(msg)  ::cellforge::core::log(::cellforge::core::LogLevel::Info,  (msg))
#define CELLFORGE_LOG_WARN(msg)  ::cellforge::core::log(::cellforge::core::LogLevel::Warn,  (msg))
#define CELLFORGE_LOG_ERROR(msg) ::cellforge::core::log(::cellforge::core::LogLevel::Error, (msg))
