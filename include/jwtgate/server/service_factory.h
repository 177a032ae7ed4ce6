#pragma once

#include <memory>

#include "jwtgate/auth/key_resolver.h"
#include "jwtgate/auth/validation_service.h"
#include "jwtgate/config/service_config.h"
#include "jwtgate/metrics/metrics_recorder.h"

namespace jwtgate {
namespace server {

/**
 * @brief Key resolver for the configured key source
 *
 * jwks_path wins over jwks_url. A JWKS resolver performs its initial fetch
 * here and starts refreshing in the background.
 *
 * @throws ConfigurationError when no source is set or keys cannot be loaded
 */
std::shared_ptr<auth::KeyResolver> createKeyResolver(
    const config::ServiceConfig& config);

// Wires verifier, policy evaluator and header projector around resolver
std::shared_ptr<auth::ValidationService> createValidationService(
    const config::ServiceConfig& config,
    std::shared_ptr<auth::KeyResolver> resolver,
    std::shared_ptr<metrics::MetricsRecorder> recorder);

}  // namespace server
}  // namespace jwtgate
