#define JWTGATE_LOG_COMPONENT "jwtgate.policy"

#include "jwtgate/auth/claim_policy.h"

#include <cstring>

#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
  return s.compare(0, std::strlen(prefix), prefix) == 0;
}

}  // namespace

ClaimPolicy ClaimPolicy::from_parameters(const QueryParameters& params) {
  ClaimPolicy policy;
  for (const auto& param : params) {
    const std::string& key = param.first;
    // The regex prefix is itself literal-prefixed, so test it first
    if (starts_with(key, kRegexPrefix)) {
      policy.add(key.substr(std::strlen(kRegexPrefix)),
                 ClaimPattern{PatternKind::REGEX, param.second});
    } else if (starts_with(key, kLiteralPrefix)) {
      policy.add(key.substr(std::strlen(kLiteralPrefix)),
                 ClaimPattern{PatternKind::LITERAL, param.second});
    }
  }
  return policy;
}

void ClaimPolicy::add(const std::string& claim_name, ClaimPattern pattern) {
  requirements_[claim_name].push_back(std::move(pattern));
}

ClaimPolicyEvaluator::ClaimPolicyEvaluator(std::shared_ptr<PatternCache> cache,
                                           EmptyPolicyMode empty_mode,
                                           RegexMatchMode match_mode)
    : cache_(std::move(cache)),
      empty_mode_(empty_mode),
      match_mode_(match_mode) {
  if (!cache_) {
    cache_ = std::make_shared<PatternCache>();
  }
}

PolicyDecision ClaimPolicyEvaluator::evaluate(const ClaimSet& claims,
                                              const ClaimPolicy& policy) const {
  if (policy.empty()) {
    if (empty_mode_ == EmptyPolicyMode::DENY) {
      JWTGATE_LOG(Warning, "no claim requirements in request, denying");
      return PolicyDecision::reject("");
    }
    JWTGATE_LOG(Warning, "no claim requirements in request, skipping");
    return PolicyDecision::accept();
  }

  for (const auto& requirement : policy.requirements()) {
    const ClaimValue* value = claims.find(requirement.first);
    if (value == nullptr) {
      JWTGATE_LOG(Debug, "claim '{}' absent from token", requirement.first);
      return PolicyDecision::reject(requirement.first);
    }
    if (!satisfies(*value, requirement.second)) {
      JWTGATE_LOG(Debug, "claim '{}' did not match required values",
                  requirement.first);
      return PolicyDecision::reject(requirement.first);
    }
  }
  return PolicyDecision::accept();
}

bool ClaimPolicyEvaluator::satisfies(
    const ClaimValue& value,
    const std::vector<ClaimPattern>& patterns) const {
  struct Visitor {
    const ClaimPolicyEvaluator& self;
    const std::vector<ClaimPattern>& patterns;

    bool operator()(const ScalarClaim& scalar) const {
      return self.matches_any(scalar.value, patterns);
    }
    bool operator()(const SequenceClaim& seq) const {
      for (const auto& element : seq.values) {
        if (self.matches_any(element, patterns)) {
          return true;
        }
      }
      return false;  // includes the empty array
    }
    bool operator()(const OtherClaim&) const { return false; }
  };

  return visit(Visitor{*this, patterns}, value);
}

bool ClaimPolicyEvaluator::matches_any(
    const std::string& value,
    const std::vector<ClaimPattern>& patterns) const {
  for (const auto& pattern : patterns) {
    if (matches(value, pattern)) {
      return true;
    }
  }
  return false;
}

bool ClaimPolicyEvaluator::matches(const std::string& value,
                                   const ClaimPattern& pattern) const {
  if (pattern.kind == PatternKind::LITERAL) {
    return value == pattern.pattern;
  }

  auto compiled = cache_->get_or_compile(pattern.pattern);
  if (!compiled->ok()) {
    return false;
  }
  // The std::regex executor recurses per input character
  if (value.size() > kMaxRegexSubjectLength) {
    JWTGATE_LOG(Warning,
                "claim value of {} bytes exceeds regex limit of {}, "
                "treating as non-match",
                value.size(), kMaxRegexSubjectLength);
    return false;
  }
  try {
    if (match_mode_ == RegexMatchMode::FULL) {
      return std::regex_match(value, *compiled->regex);
    }
    return std::regex_search(value, *compiled->regex);
  } catch (const std::regex_error& e) {
    JWTGATE_LOG(Warning, "claim pattern '{}' failed to match: {}",
                pattern.pattern, e.what());
    return false;
  }
}

}  // namespace auth
}  // namespace jwtgate
