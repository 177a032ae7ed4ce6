#ifndef JWTGATE_AUTH_JWT_VERIFIER_H
#define JWTGATE_AUTH_JWT_VERIFIER_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "jwtgate/auth/auth_types.h"
#include "jwtgate/auth/claims.h"
#include "jwtgate/auth/key_resolver.h"

/**
 * @file jwt_verifier.h
 * @brief Compact JWS signature and time-claim verification
 */

namespace jwtgate {
namespace auth {

/**
 * @brief Outcome of verifying one credential
 *
 * claims is populated only when valid is true.
 */
struct JwtVerificationResult {
  bool valid{false};
  AuthErrorCode error_code{AuthErrorCode::MALFORMED_TOKEN};
  std::string error_message;
  JwtHeader header;
  ClaimSet claims;

  static JwtVerificationResult failure(AuthErrorCode code,
                                       std::string message) {
    JwtVerificationResult r;
    r.error_code = code;
    r.error_message = std::move(message);
    return r;
  }
};

/**
 * @brief Signature algorithms accepted by the verifier
 */
enum class SignatureAlgorithm {
  ES256, ES384, ES512,
  RS256, RS384, RS512,
  PS256, PS384, PS512
};

/**
 * @brief Map a JOSE "alg" value
 * @return nullopt for "none", HMAC and anything unknown
 */
optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& alg);

struct JwtVerifierConfig {
  std::chrono::seconds clock_skew{0};
};

/**
 * @brief Verifies compact-serialized JWS tokens
 *
 * Stateless apart from the shared key resolver; safe for concurrent use.
 */
class TokenVerifier {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  TokenVerifier(std::shared_ptr<KeyResolver> resolver,
                const JwtVerifierConfig& config = JwtVerifierConfig());

  /**
   * @brief Verify signature and structural time claims
   *
   * Steps: split into three segments, decode and check the header, resolve
   * the key, check key/algorithm compatibility, verify the signature over
   * "header.payload", decode the payload object, then validate exp, nbf
   * and iat.
   */
  JwtVerificationResult verify(const std::string& token) const;

  // Replaces the wall clock; used by tests
  void set_clock(Clock clock) { clock_ = std::move(clock); }

 private:
  std::shared_ptr<KeyResolver> resolver_;
  JwtVerifierConfig config_;
  Clock clock_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_JWT_VERIFIER_H
