#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "jwtgate/logging/log_formatter.h"
#include "jwtgate/logging/log_message.h"

namespace jwtgate {
namespace logging {

// Destination for formatted log lines. Implementations must be thread-safe.
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes one line per message to stdout or stderr; Error and above are
// flushed immediately.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  Target target_;
  std::mutex mutex_;
};

// Hands each formatted line to a callback (level, logger name, line)
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override;
  void flush() override {}

 private:
  LogCallback callback_;
};

}  // namespace logging
}  // namespace jwtgate
