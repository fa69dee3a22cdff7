// Repository: Reelsmith
// Component: Request Logger
// Purpose: Mutex-protected log emission scoped to one assembly request.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_UTIL_LOGGER_HPP_
#define REELSMITH_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelsmith::util {

// Logger emits whole lines under a single process-wide mutex so concurrent
// requests (and the loader worker pool) never interleave partial lines.
// Each instance carries the request prefix it was created with; there is no
// global logger, the instance travels inside AssemblyContext.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when debug is enabled or REELSMITH_DEBUG is set
// Warn  → stderr (skipped assets, degraded fallbacks)
// Error → stderr (terminal request failures)
//
// Test-only: the Set*Sink hooks receive every line of that level (without
// the request prefix) in addition to the stream output.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  Logger() = default;
  explicit Logger(std::string request_id, bool debug_enabled = false);

  void Info(const std::string& line) const;
  void Debug(const std::string& line) const;
  void Warn(const std::string& line) const;
  void Error(const std::string& line) const;

  // Call with nullptr to clear.
  void SetInfoSink(Sink sink);
  void SetWarnSink(Sink sink);
  void SetErrorSink(Sink sink);

  bool DebugEnabled() const { return debug_enabled_; }
  const std::string& RequestId() const { return request_id_; }

 private:
  std::string Prefix(const std::string& line) const;

  static std::mutex mutex_;

  std::string request_id_;
  bool debug_enabled_ = false;
  Sink info_sink_;
  Sink warn_sink_;
  Sink error_sink_;
};

}  // namespace reelsmith::util

#endif  // REELSMITH_UTIL_LOGGER_HPP_
