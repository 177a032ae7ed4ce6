#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "jwtgate/logging/log_level.h"
#include "jwtgate/logging/log_message.h"
#include "jwtgate/logging/log_sink.h"

namespace jwtgate {
namespace logging {

/**
 * @brief Named, synchronous logger
 *
 * The fmt arguments are only formatted when the level is enabled. All
 * loggers of a registry share one sink, which serializes writes.
 */
class Logger {
 public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg = makeMessage(level, fmt, std::forward<Args>(args)...);
    msg.file = file;
    msg.line = line;
    write(msg);
  }

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* fmt,
                      Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg = makeMessage(level, fmt, std::forward<Args>(args)...);
    msg.fields = ctx.fields();
    write(msg);
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= level_.load(std::memory_order_relaxed);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }
  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  const std::string& name() const { return name_; }

  void flush() {
    if (auto sink = currentSink()) {
      sink->flush();
    }
  }

 private:
  template <typename... Args>
  LogMessage makeMessage(LogLevel level, const char* fmt, Args&&... args) {
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.message = fmt::format(fmt, std::forward<Args>(args)...);
    return msg;
  }

  std::shared_ptr<LogSink> currentSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  void write(const LogMessage& msg) {
    // Hold a reference so a concurrent setSink cannot free it mid-write
    if (auto sink = currentSink()) {
      sink->log(msg);
    }
  }

  std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace jwtgate
