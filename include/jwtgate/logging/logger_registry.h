#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "jwtgate/logging/logger.h"

namespace jwtgate {
namespace logging {

/**
 * @brief Process-wide set of named loggers sharing one sink and level
 *
 * Works without configuration: loggers created before configure() write
 * text to stderr at Info. Loggers are never destroyed, so a pointer
 * returned by getOrCreateLogger stays valid and sees later changes.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  // Applies level and formatter ("text" or "json") to every logger
  void configure(LogLevel level, const std::string& format);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Replaces the sink shared by all loggers
  void setSink(std::shared_ptr<LogSink> sink);

  void flushAll();

  // Back to stderr text output at Info
  void reset();

 private:
  LoggerRegistry();

  void applyLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  LogLevel level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
};

}  // namespace logging
}  // namespace jwtgate
