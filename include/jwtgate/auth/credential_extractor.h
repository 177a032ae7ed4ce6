#ifndef JWTGATE_AUTH_CREDENTIAL_EXTRACTOR_H
#define JWTGATE_AUTH_CREDENTIAL_EXTRACTOR_H

#include <string>

#include "jwtgate/auth/auth_types.h"
#include "jwtgate/auth/request_context.h"
#include "jwtgate/core/optional.h"

/**
 * @file credential_extractor.h
 * @brief Locates the raw bearer credential in a request
 */

namespace jwtgate {
namespace auth {

struct ExtractionResult {
  bool found{false};
  std::string token;
  AuthErrorCode error_code{AuthErrorCode::EXTRACTION_ERROR};
  std::string error_message;

  static ExtractionResult success(std::string token) {
    ExtractionResult r;
    r.found = true;
    r.token = std::move(token);
    r.error_code = AuthErrorCode::SUCCESS;
    return r;
  }
  static ExtractionResult failure(std::string message) {
    ExtractionResult r;
    r.error_message = std::move(message);
    return r;
  }
};

/**
 * @brief Credential lookup
 *
 * When the query parameter "cookie" names a cookie the token is read from
 * the Cookie header; otherwise it must be "Authorization: Bearer <token>".
 * Never throws.
 */
class CredentialExtractor {
 public:
  static constexpr const char* kCookieParameter = "cookie";

  ExtractionResult extract(const RequestContext& request) const;

  static optional<std::string> find_cookie(const std::string& cookie_header,
                                           const std::string& name);

  static optional<std::string> parse_bearer(const std::string& authorization);
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_CREDENTIAL_EXTRACTOR_H
