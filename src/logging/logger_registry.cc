#include "jwtgate/logging/logger_registry.h"

namespace jwtgate {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry()
    : sink_(std::make_shared<StdioSink>(StdioSink::Stderr)) {}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& logger = loggers_[name];
  if (!logger) {
    logger = std::make_shared<Logger>(name);
    logger->setLevel(level_);
    logger->setSink(sink_);
  }
  return logger;
}

void LoggerRegistry::configure(LogLevel level, const std::string& format) {
  auto sink = std::make_shared<StdioSink>(StdioSink::Stderr);
  sink->setFormatter(createFormatter(format));

  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  level_ = level;
  applyLocked();
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  applyLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerRegistry::setSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
  applyLocked();
}

void LoggerRegistry::flushAll() {
  std::shared_ptr<LogSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = sink_;
  }
  if (sink) {
    sink->flush();
  }
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = LogLevel::Info;
  sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  applyLocked();
}

void LoggerRegistry::applyLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(level_);
    entry.second->setSink(sink_);
  }
}

}  // namespace logging
}  // namespace jwtgate
