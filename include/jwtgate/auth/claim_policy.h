#ifndef JWTGATE_AUTH_CLAIM_POLICY_H
#define JWTGATE_AUTH_CLAIM_POLICY_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "jwtgate/auth/auth_types.h"
#include "jwtgate/auth/claims.h"
#include "jwtgate/auth/pattern_cache.h"
#include "jwtgate/auth/request_context.h"

/**
 * @file claim_policy.h
 * @brief Per-request claim requirements and their evaluation
 */

namespace jwtgate {
namespace auth {

enum class PatternKind { LITERAL, REGEX };

struct ClaimPattern {
  PatternKind kind;
  std::string pattern;
};

/**
 * @brief Required claims: AND across claim names, OR across patterns
 */
class ClaimPolicy {
 public:
  static constexpr const char* kLiteralPrefix = "claims_";
  static constexpr const char* kRegexPrefix = "claims_regexp_";

  /**
   * @brief Derive the policy from query parameters
   *
   * claims_<name>=<value> adds a literal pattern, claims_regexp_<name>=<re>
   * adds a regular expression. Repeated parameters add alternatives.
   * Parameters with neither prefix are ignored.
   */
  static ClaimPolicy from_parameters(const QueryParameters& params);

  void add(const std::string& claim_name, ClaimPattern pattern);

  bool empty() const { return requirements_.empty(); }
  size_t size() const { return requirements_.size(); }

  const std::map<std::string, std::vector<ClaimPattern>>& requirements()
      const {
    return requirements_;
  }

 private:
  std::map<std::string, std::vector<ClaimPattern>> requirements_;
};

// What to do when a request names no claim requirement at all
enum class EmptyPolicyMode { ALLOW, DENY };

// SEARCH matches anywhere in the value; FULL must match the whole value
enum class RegexMatchMode { SEARCH, FULL };

struct PolicyDecision {
  bool accepted{false};
  AuthErrorCode error_code{AuthErrorCode::POLICY_MISMATCH};
  std::string failed_claim;  // first claim that rejected, if any

  explicit operator bool() const { return accepted; }

  static PolicyDecision accept() {
    return PolicyDecision{true, AuthErrorCode::SUCCESS, {}};
  }
  static PolicyDecision reject(const std::string& claim) {
    return PolicyDecision{false, AuthErrorCode::POLICY_MISMATCH, claim};
  }
};

/**
 * @brief Evaluates a ClaimPolicy against a verified ClaimSet
 *
 * Stateless apart from the shared pattern cache; safe to call from any
 * number of worker threads.
 */
class ClaimPolicyEvaluator {
 public:
  // Longer claim values never match a regular expression pattern
  static constexpr size_t kMaxRegexSubjectLength = 4096;

  ClaimPolicyEvaluator(std::shared_ptr<PatternCache> cache,
                       EmptyPolicyMode empty_mode = EmptyPolicyMode::ALLOW,
                       RegexMatchMode match_mode = RegexMatchMode::SEARCH);

  PolicyDecision evaluate(const ClaimSet& claims,
                          const ClaimPolicy& policy) const;

  // True when value satisfies at least one of the patterns
  bool matches_any(const std::string& value,
                   const std::vector<ClaimPattern>& patterns) const;

 private:
  bool matches(const std::string& value, const ClaimPattern& pattern) const;
  bool satisfies(const ClaimValue& value,
                 const std::vector<ClaimPattern>& patterns) const;

  std::shared_ptr<PatternCache> cache_;
  EmptyPolicyMode empty_mode_;
  RegexMatchMode match_mode_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_CLAIM_POLICY_H
