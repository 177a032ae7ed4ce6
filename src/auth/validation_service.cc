#define JWTGATE_LOG_COMPONENT "jwtgate.validate"

#include "jwtgate/auth/validation_service.h"

#include <chrono>
#include <exception>

#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

constexpr int kStatusOk = 200;
constexpr int kStatusUnauthorized = 401;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternalError = 500;

}  // namespace

ValidationService::ValidationService(
    std::shared_ptr<TokenVerifier> verifier,
    std::shared_ptr<ClaimPolicyEvaluator> evaluator,
    HeaderProjector projector,
    std::shared_ptr<metrics::MetricsRecorder> recorder)
    : verifier_(std::move(verifier)),
      evaluator_(std::move(evaluator)),
      projector_(std::move(projector)),
      recorder_(std::move(recorder)) {
  if (!verifier_ || !evaluator_) {
    throw ConfigurationError("validation service needs a verifier and an "
                             "evaluator");
  }
  if (!recorder_) {
    recorder_ = std::make_shared<metrics::NullRecorder>();
  }
}

ValidationResponse ValidationService::handle(
    const RequestContext& request) const {
  ValidationResponse response;
  try {
    response = validate(request);
  } catch (const std::exception& e) {
    JWTGATE_LOG(Error, "validation of {} aborted: {}", request.uri, e.what());
    response = ValidationResponse();
    response.status = kStatusInternalError;
  }

  recorder_->increment_status(response.status);

  logging::LogContext ctx;
  ctx.with("url", request.uri)
      .with("status", std::to_string(response.status))
      .with("method", request.method)
      .with("userAgent", request.header("User-Agent").value_or(""));
  JWTGATE_LOG_WITH_CONTEXT(Debug, ctx, "handled validation request");
  return response;
}

ValidationResponse ValidationService::validate(
    const RequestContext& request) const {
  ValidationResponse response;

  if (request.method != "GET" && request.method != "HEAD") {
    JWTGATE_LOG(Info, "invalid method {}", request.method);
    response.status = kStatusMethodNotAllowed;
    return response;
  }

  response.status = kStatusUnauthorized;

  ExtractionResult credential = extractor_.extract(request);
  if (!credential.found) {
    JWTGATE_LOG(Debug, "no credential: {}", credential.error_message);
    return response;
  }

  const auto started = std::chrono::steady_clock::now();
  JwtVerificationResult verified = verifier_->verify(credential.token);
  recorder_->observe_validation_seconds(
      std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                    started)
          .count());

  if (!verified.valid) {
    JWTGATE_LOG(Debug, "token rejected ({}): {}",
                auth_error_code_name(verified.error_code),
                verified.error_message);
    return response;
  }

  ClaimPolicy policy = ClaimPolicy::from_parameters(request.query);
  PolicyDecision decision = evaluator_->evaluate(verified.claims, policy);
  if (!decision) {
    JWTGATE_LOG(Debug, "claim '{}' does not satisfy the policy",
                decision.failed_claim);
    return response;
  }

  response.status = kStatusOk;
  response.headers = projector_.project(verified.claims, request.query);
  return response;
}

}  // namespace auth
}  // namespace jwtgate
