#include "jwtgate/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace jwtgate {
namespace logging {

namespace {

// ISO 8601 in UTC with milliseconds, so replicas' lines sort together
std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000;
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, millis);
}

std::string formatThreadId(std::thread::id id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "[{}] [{}] [T:{}] ",
                 formatTimestamp(msg.timestamp), logLevelToString(msg.level),
                 formatThreadId(msg.thread_id));
  if (!msg.logger_name.empty()) {
    fmt::format_to(std::back_inserter(out), "[{}] ", msg.logger_name);
  }
  if (msg.file && msg.line > 0) {
    fmt::format_to(std::back_inserter(out), "[{}:{}] ", msg.file, msg.line);
  }
  fmt::format_to(std::back_inserter(out), "{}", msg.message);

  const char* separator = " {";
  for (const auto& field : msg.fields) {
    fmt::format_to(std::back_inserter(out), "{}{}={}", separator, field.first,
                   field.second);
    separator = ", ";
  }
  if (!msg.fields.empty()) {
    out.push_back('}');
  }
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json line = {{"timestamp", formatTimestamp(msg.timestamp)},
                         {"level", logLevelToString(msg.level)},
                         {"logger", msg.logger_name},
                         {"thread", formatThreadId(msg.thread_id)},
                         {"message", msg.message}};
  if (msg.file) {
    line["file"] = msg.file;
    line["line"] = msg.line;
  }
  if (!msg.fields.empty()) {
    line["fields"] = msg.fields;
  }
  // Claim values and URLs come from clients and need not be valid UTF-8
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<Formatter> createFormatter(const std::string& name) {
  if (toLowerAscii(name) == "json") {
    return std::make_unique<JsonFormatter>();
  }
  return std::make_unique<DefaultFormatter>();
}

}  // namespace logging
}  // namespace jwtgate
