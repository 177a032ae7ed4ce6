#include "jwtgate/auth/claims.h"

#include <nlohmann/json.hpp>

namespace jwtgate {
namespace auth {

ClaimValue classify_claim(const nlohmann::json& value) {
  if (value.is_string()) {
    return ScalarClaim{value.get<std::string>()};
  }

  if (value.is_array()) {
    SequenceClaim seq;
    seq.values.reserve(value.size());
    for (const auto& element : value) {
      if (!element.is_string()) {
        return OtherClaim{value.dump()};
      }
      seq.values.push_back(element.get<std::string>());
    }
    return seq;
  }

  return OtherClaim{value.dump()};
}

ClaimSet ClaimSet::from_json(const nlohmann::json& payload) {
  ClaimSet set;
  if (!payload.is_object()) {
    return set;
  }

  for (auto it = payload.begin(); it != payload.end(); ++it) {
    set.claims_.emplace(it.key(), classify_claim(it.value()));
  }
  return set;
}

const ClaimValue* ClaimSet::find(const std::string& name) const {
  auto it = claims_.find(name);
  if (it == claims_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace auth
}  // namespace jwtgate
