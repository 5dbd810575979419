// Repository: Hush
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission — prevents multi-thread interleave.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_UTIL_LOGGER_HPP_
#define HUSH_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace hush::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes — guaranteeing no interleave between concurrent transcription
// workers.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when verbose is enabled or HUSH_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions, e.g. retried attempts)
// Error → stderr (failed chunks, aborted runs)
//
// Test-only: SetErrorSink / SetWarnSink install callbacks invoked for every
// Error() / Warn() line (in addition to stderr).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetVerbose(bool verbose);
  static bool IsDebugEnabled();

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::atomic<bool> verbose_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace hush::util

#endif  // HUSH_UTIL_LOGGER_HPP_
