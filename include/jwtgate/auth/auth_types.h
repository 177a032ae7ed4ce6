#ifndef JWTGATE_AUTH_AUTH_TYPES_H
#define JWTGATE_AUTH_AUTH_TYPES_H

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file auth_types.h
 * @brief Core type definitions for token validation
 */

namespace jwtgate {
namespace auth {

/**
 * @brief Per-request validation error codes
 *
 * Every non-SUCCESS value is reported to the proxy as 401, except
 * INTERNAL_ERROR which maps to 500.
 */
enum class AuthErrorCode : int32_t {
  SUCCESS = 0,
  MALFORMED_TOKEN = -1000,
  INVALID_SIGNATURE = -1001,
  EXPIRED_TOKEN = -1002,
  INVALID_CLAIMS = -1003,
  UNSUPPORTED_ALGORITHM = -1004,
  KEY_RESOLUTION_ERROR = -1005,
  EXTRACTION_ERROR = -1006,
  POLICY_MISMATCH = -1007,
  PATTERN_COMPILE_ERROR = -1008,
  INTERNAL_ERROR = -1009
};

inline const char* auth_error_code_name(AuthErrorCode code) {
  switch (code) {
    case AuthErrorCode::SUCCESS: return "SUCCESS";
    case AuthErrorCode::MALFORMED_TOKEN: return "MALFORMED_TOKEN";
    case AuthErrorCode::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
    case AuthErrorCode::EXPIRED_TOKEN: return "EXPIRED_TOKEN";
    case AuthErrorCode::INVALID_CLAIMS: return "INVALID_CLAIMS";
    case AuthErrorCode::UNSUPPORTED_ALGORITHM: return "UNSUPPORTED_ALGORITHM";
    case AuthErrorCode::KEY_RESOLUTION_ERROR: return "KEY_RESOLUTION_ERROR";
    case AuthErrorCode::EXTRACTION_ERROR: return "EXTRACTION_ERROR";
    case AuthErrorCode::POLICY_MISMATCH: return "POLICY_MISMATCH";
    case AuthErrorCode::PATTERN_COMPILE_ERROR: return "PATTERN_COMPILE_ERROR";
    case AuthErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

/**
 * @brief Startup failure: missing or unusable key material, bad config
 *
 * Thrown only while the service is being built; never on the request path.
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_AUTH_TYPES_H
