#pragma once

#include "jwtgate/logging/logger_registry.h"

// Each translation unit defines JWTGATE_LOG_COMPONENT, the logger name,
// before including this header.
#ifndef JWTGATE_LOG_COMPONENT
#define JWTGATE_LOG_COMPONENT "jwtgate"
#endif

#define JWTGATE_LOG(level, ...)                                             \
  do {                                                                      \
    auto jwtgate_logger_ =                                                  \
        ::jwtgate::logging::LoggerRegistry::instance().getOrCreateLogger(   \
            JWTGATE_LOG_COMPONENT);                                         \
    if (jwtgate_logger_->shouldLog(::jwtgate::logging::LogLevel::level)) { \
      jwtgate_logger_->log(::jwtgate::logging::LogLevel::level, __FILE__,   \
                           __LINE__, __VA_ARGS__);                          \
    }                                                                       \
  } while (0)

// Structured variant; fields come from a LogContext
#define JWTGATE_LOG_WITH_CONTEXT(level, context, ...)                       \
  do {                                                                      \
    auto jwtgate_logger_ =                                                  \
        ::jwtgate::logging::LoggerRegistry::instance().getOrCreateLogger(   \
            JWTGATE_LOG_COMPONENT);                                         \
    if (jwtgate_logger_->shouldLog(::jwtgate::logging::LogLevel::level)) { \
      jwtgate_logger_->logWithContext(::jwtgate::logging::LogLevel::level,  \
                                      context, __VA_ARGS__);                \
    }                                                                       \
  } while (0)
