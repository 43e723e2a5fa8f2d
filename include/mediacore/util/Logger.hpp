// Repository: Mediacore-player
// Component: Thread-Safe Logger
// Purpose: Leveled, mutex-protected log emission shared by every thread.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_UTIL_LOGGER_HPP_
#define MEDIACORE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace mediacore::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Logger serializes every line behind one static mutex, so output from the
// caller thread, the decoder engine, the sink control thread and gRPC
// handlers never interleaves.
//
// Info, Debug  → stdout
// Warn, Error  → stderr
//
// Lines below the threshold are dropped before the mutex is taken. The
// threshold starts at Debug when MEDIACORE_DEBUG is set in the environment
// (or defined at build time), otherwise Info.
//
// Never call from the real-time audio callback.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel Level();
  static bool Enabled(LogLevel level);

  // Test hook: receives every emitted line in addition to the stream.
  // Pass nullptr to clear.
  static void SetSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink sink_;
};

}  // namespace mediacore::util

#endif  // MEDIACORE_UTIL_LOGGER_HPP_
