// Repository: Reelmix
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one whole line per call.
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_UTIL_LOGGER_HPP_
#define REELMIX_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelmix::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Selection itself is single-threaded, but the gRPC server may run
// several requests at once.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when REELMIX_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (hard faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that severity (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace reelmix::util

#endif  // REELMIX_UTIL_LOGGER_HPP_
