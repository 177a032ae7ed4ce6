#pragma once

#include <memory>
#include <string>

#include "jwtgate/logging/log_message.h"

namespace jwtgate {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// Human-readable single line
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line for log shippers
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// "json" selects JsonFormatter; anything else is the text format
std::unique_ptr<Formatter> createFormatter(const std::string& name);

}  // namespace logging
}  // namespace jwtgate
