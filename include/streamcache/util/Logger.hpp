// Repository: Retrovue-streamcache
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, no multi-thread interleave.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_UTIL_LOGGER_HPP_
#define STREAMCACHE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace streamcache::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the scheduler drain, readiness waits, the prefetch
// worker and transport callbacks never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when STREAMCACHE_DEBUG env is set (per-poll detail)
// Warn  → stderr (degraded but recoverable: stale ids, fallbacks, timeouts)
// Error → stderr (transport failures, invalid containers, I/O errors)
//
// Test-only: SetErrorSink / SetWarnSink install callbacks invoked for every
// Error() / Warn() line (in addition to stderr).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace streamcache::util

#endif  // STREAMCACHE_UTIL_LOGGER_HPP_
