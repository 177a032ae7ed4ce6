#ifndef JWTGATE_AUTH_CLAIMS_H
#define JWTGATE_AUTH_CLAIMS_H

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "jwtgate/core/optional.h"

/**
 * @file claims.h
 * @brief Typed view of a verified token payload
 */

namespace jwtgate {
namespace auth {

/** @brief A claim holding a single string */
struct ScalarClaim {
  std::string value;
};

/** @brief A claim holding an array whose elements are all strings */
struct SequenceClaim {
  std::vector<std::string> values;
};

/**
 * @brief Any other JSON shape (number, bool, object, null, mixed array)
 *
 * Keeps the compact JSON text so it can still be projected into headers.
 */
struct OtherClaim {
  std::string json;
};

using ClaimValue = variant<ScalarClaim, SequenceClaim, OtherClaim>;

/**
 * @brief Immutable claim name -> value mapping built from a payload object
 */
class ClaimSet {
 public:
  ClaimSet() = default;

  /**
   * @brief Build from a decoded payload
   * @param payload JSON object; any other type yields an empty set
   */
  static ClaimSet from_json(const nlohmann::json& payload);

  // nullptr when the claim is absent
  const ClaimValue* find(const std::string& name) const;

  bool contains(const std::string& name) const {
    return find(name) != nullptr;
  }
  bool empty() const { return claims_.empty(); }
  size_t size() const { return claims_.size(); }

 private:
  std::unordered_map<std::string, ClaimValue> claims_;
};

/**
 * @brief Classify one JSON value
 */
ClaimValue classify_claim(const nlohmann::json& value);

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_CLAIMS_H
