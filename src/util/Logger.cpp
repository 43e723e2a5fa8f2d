// Repository: Mediacore-player
// Component: Thread-Safe Logger
// Purpose: Leveled, mutex-protected log emission shared by every thread.
// Copyright (c) 2025 Mediacore

#include "mediacore/util/Logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace mediacore::util {

namespace {

LogLevel InitialLevel() {
#ifdef MEDIACORE_DEBUG
  return LogLevel::kDebug;
#else
  return std::getenv("MEDIACORE_DEBUG") != nullptr ? LogLevel::kDebug : LogLevel::kInfo;
#endif
}

std::atomic<int>& Threshold() {
  static std::atomic<int> threshold{static_cast<int>(InitialLevel())};
  return threshold;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
void Logger::Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::SetLevel(LogLevel level) {
  Threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::Level() {
  return static_cast<LogLevel>(Threshold().load(std::memory_order_relaxed));
}

bool Logger::Enabled(LogLevel level) {
  return static_cast<int>(level) >= Threshold().load(std::memory_order_relaxed);
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (!Enabled(level)) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace mediacore::util
