#define JWTGATE_LOG_COMPONENT "jwtgate.server"

#include "jwtgate/server/service_factory.h"

#include "jwtgate/auth/claim_policy.h"
#include "jwtgate/auth/header_projector.h"
#include "jwtgate/auth/jwks_client.h"
#include "jwtgate/auth/jwt_verifier.h"
#include "jwtgate/auth/pattern_cache.h"
#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace server {

std::shared_ptr<auth::KeyResolver> createKeyResolver(
    const config::ServiceConfig& config) {
  if (!config.jwks_path.empty()) {
    if (!config.jwks_url.empty()) {
      JWTGATE_LOG(Warning, "both JWKS_PATH and JWKS_URL set, using {}",
                  config.jwks_path);
    }
    return auth::StaticKeyResolver::from_file(config.jwks_path);
  }

  if (config.jwks_url.empty()) {
    throw auth::ConfigurationError("no JWKS_URL or JWKS_PATH");
  }

  auth::JwksClientConfig client_config;
  client_config.jwks_uri = config.jwks_url;
  client_config.request_timeout = config.jwks_request_timeout;
  client_config.verify_ssl = !config.insecure_skip_verify;
  if (config.insecure_skip_verify) {
    JWTGATE_LOG(Warning, "TLS verification disabled for {}", config.jwks_url);
  }

  auth::JwksResolverConfig resolver_config;
  resolver_config.refresh_interval = config.jwks_refresh_interval;
  resolver_config.refresh_unknown_kid = config.refresh_unknown_kid;
  resolver_config.refresh_rate_limit = config.refresh_rate_limit;

  return std::make_shared<auth::JwksKeyResolver>(
      std::make_shared<auth::HttpJwksSource>(client_config), resolver_config);
}

std::shared_ptr<auth::ValidationService> createValidationService(
    const config::ServiceConfig& config,
    std::shared_ptr<auth::KeyResolver> resolver,
    std::shared_ptr<metrics::MetricsRecorder> recorder) {
  auth::JwtVerifierConfig verifier_config;
  verifier_config.clock_skew = config.clock_skew;
  auto verifier = std::make_shared<auth::TokenVerifier>(std::move(resolver),
                                                        verifier_config);

  auto evaluator = std::make_shared<auth::ClaimPolicyEvaluator>(
      std::make_shared<auth::PatternCache>(),
      config.empty_policy == "deny" ? auth::EmptyPolicyMode::DENY
                                    : auth::EmptyPolicyMode::ALLOW,
      config.regex_match_mode == "full" ? auth::RegexMatchMode::FULL
                                        : auth::RegexMatchMode::SEARCH);

  return std::make_shared<auth::ValidationService>(
      std::move(verifier), std::move(evaluator),
      auth::HeaderProjector(config.response_headers), std::move(recorder));
}

}  // namespace server
}  // namespace jwtgate
