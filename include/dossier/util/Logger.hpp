// Repository: Dossier-render
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the render loop and worker threads.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_UTIL_LOGGER_HPP_
#define DOSSIER_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace dossier::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. The frame loop, the audio worker and subprocess stderr readers
// all log through here, so lines never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when DOSSIER_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions, e.g. silent fallback)
// Error → stderr (render-aborting failures)
//
// Lines are expected to carry a "[Component] " prefix.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: capture lines in addition to the console stream.
  // Call with nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace dossier::util

#endif  // DOSSIER_UTIL_LOGGER_HPP_
