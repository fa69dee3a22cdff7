// Repository: Reelsmith
// Component: Request Logger
// Purpose: Mutex-protected log emission scoped to one assembly request.
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace reelsmith::util {

std::mutex Logger::mutex_;

Logger::Logger(std::string request_id, bool debug_enabled)
    : request_id_(std::move(request_id)),
      debug_enabled_(debug_enabled || std::getenv("REELSMITH_DEBUG") != nullptr) {}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

std::string Logger::Prefix(const std::string& line) const {
  if (request_id_.empty()) return line;
  return "[req=" + request_id_ + "] " + line;
}

void Logger::Info(const std::string& line) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << Prefix(line) << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) const {
  if (!debug_enabled_) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << Prefix(line) << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << Prefix(line) << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << Prefix(line) << '\n';
  std::cerr.flush();
}

}  // namespace reelsmith::util
