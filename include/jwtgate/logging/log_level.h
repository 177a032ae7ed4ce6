#pragma once

#include <cstdint>
#include <string>

namespace jwtgate {
namespace logging {

// Severity levels (RFC-5424 ordering)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Off = 6
};

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline std::string toLowerAscii(const std::string& str) {
  std::string lower;
  lower.reserve(str.size());
  for (char c : str) {
    lower += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  }
  return lower;
}

// Accepts both the RFC-5424 names and the short names used by the
// LOG_LEVEL environment variable ("warn", "fatal").
inline LogLevel stringToLogLevel(const std::string& str) {
  const std::string s = toLowerAscii(str);
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "notice") return LogLevel::Notice;
  if (s == "warning" || s == "warn") return LogLevel::Warning;
  if (s == "error") return LogLevel::Error;
  if (s == "critical" || s == "fatal") return LogLevel::Critical;
  if (s == "off") return LogLevel::Off;
  return LogLevel::Info;  // Default
}

inline bool isKnownLogLevel(const std::string& str) {
  const std::string s = toLowerAscii(str);
  return s == "debug" || s == "info" || s == "notice" || s == "warning" ||
         s == "warn" || s == "error" || s == "critical" || s == "fatal" ||
         s == "off";
}

}  // namespace logging
}  // namespace jwtgate
