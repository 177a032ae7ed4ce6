#ifndef JWTGATE_AUTH_VALIDATION_SERVICE_H
#define JWTGATE_AUTH_VALIDATION_SERVICE_H

#include <memory>
#include <string>

#include "jwtgate/auth/claim_policy.h"
#include "jwtgate/auth/credential_extractor.h"
#include "jwtgate/auth/header_projector.h"
#include "jwtgate/auth/jwt_verifier.h"
#include "jwtgate/auth/request_context.h"
#include "jwtgate/metrics/metrics_recorder.h"

/**
 * @file validation_service.h
 * @brief Per-request authorization pipeline behind /validate
 */

namespace jwtgate {
namespace auth {

struct ValidationResponse {
  int status{500};
  ProjectedHeaders headers;  // only on 200
};

/**
 * @brief Extract, verify, evaluate and project for one subrequest
 *
 * All collaborators are shared and thread-safe, so a single instance
 * serves every worker.
 */
class ValidationService {
 public:
  ValidationService(std::shared_ptr<TokenVerifier> verifier,
                    std::shared_ptr<ClaimPolicyEvaluator> evaluator,
                    HeaderProjector projector,
                    std::shared_ptr<metrics::MetricsRecorder> recorder);

  /**
   * @brief Handle one request and account for its status
   *
   * Status codes:
   * - 405 for methods other than GET and HEAD
   * - 401 when extraction, verification or the claim policy fails
   * - 200 with projected headers on success
   * - 500 when the pipeline throws
   */
  ValidationResponse handle(const RequestContext& request) const;

 private:
  // Unguarded pipeline; handle() catches what escapes
  ValidationResponse validate(const RequestContext& request) const;

  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<ClaimPolicyEvaluator> evaluator_;
  HeaderProjector projector_;
  CredentialExtractor extractor_;
  std::shared_ptr<metrics::MetricsRecorder> recorder_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_VALIDATION_SERVICE_H
