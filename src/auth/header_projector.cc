#define JWTGATE_LOG_COMPONENT "jwtgate.headers"

#include "jwtgate/auth/header_projector.h"

#include <cstring>
#include <set>

#include <nlohmann/json.hpp>

#include "jwtgate/auth/base64.h"
#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

struct RawValue {
  std::string operator()(const ScalarClaim& scalar) const {
    return scalar.value;
  }
  std::string operator()(const SequenceClaim& seq) const {
    return nlohmann::json(seq.values).dump();
  }
  std::string operator()(const OtherClaim& other) const { return other.json; }
};

}  // namespace

HeaderMapping HeaderProjector::mapping_for(
    const QueryParameters& params) const {
  HeaderMapping mapping = static_mapping_;
  std::set<std::string> seen;
  const size_t prefix_len = std::strlen(kHeaderPrefix);

  for (const auto& param : params) {
    if (param.first.compare(0, prefix_len, kHeaderPrefix) != 0) {
      continue;
    }
    std::string header = param.first.substr(prefix_len);
    if (header.empty() || !seen.insert(header).second) {
      continue;
    }
    mapping[header] = param.second;
  }
  return mapping;
}

ProjectedHeaders HeaderProjector::project(const ClaimSet& claims,
                                          const HeaderMapping& mapping) const {
  ProjectedHeaders headers;
  for (const auto& entry : mapping) {
    const ClaimValue* value = claims.find(entry.second);
    if (value == nullptr) {
      continue;
    }
    try {
      std::string raw = visit(RawValue{}, *value);
      headers.emplace_back(entry.first, base64_encode(raw));
      JWTGATE_LOG(Debug, "add response header {} from claim {}", entry.first,
                  entry.second);
    } catch (const nlohmann::json::exception& e) {
      // Invalid UTF-8 in a string element; drop this header only
      JWTGATE_LOG(Warning, "cannot serialize claim {}: {}", entry.second,
                  e.what());
    }
  }
  return headers;
}

}  // namespace auth
}  // namespace jwtgate
