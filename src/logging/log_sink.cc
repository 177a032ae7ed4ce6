#include "jwtgate/logging/log_sink.h"

#include <iostream>

namespace jwtgate {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  const std::string line = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream& out = target_ == Stdout ? std::cout : std::cerr;
  out << line << '\n';
  if (msg.level >= LogLevel::Error) {
    out.flush();
  }
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  (target_ == Stdout ? std::cout : std::cerr).flush();
}

void ExternalSink::log(const LogMessage& msg) {
  if (callback_) {
    callback_(msg.level, msg.logger_name, formatter_->format(msg));
  }
}

}  // namespace logging
}  // namespace jwtgate
