#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "jwtgate/logging/log_level.h"

namespace jwtgate {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;
  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  std::thread::id thread_id{std::this_thread::get_id()};

  // Call site; file is null for messages built without one
  const char* file{nullptr};
  int line{0};

  // Structured fields ("status", "method", ...)
  std::map<std::string, std::string> fields;
};

// Structured fields attached to a single log call
class LogContext {
 public:
  LogContext& with(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
  }

  const std::map<std::string, std::string>& fields() const { return fields_; }

 private:
  std::map<std::string, std::string> fields_;
};

}  // namespace logging
}  // namespace jwtgate
