#ifndef JWTGATE_AUTH_HEADER_PROJECTOR_H
#define JWTGATE_AUTH_HEADER_PROJECTOR_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "jwtgate/auth/claims.h"
#include "jwtgate/auth/request_context.h"

/**
 * @file header_projector.h
 * @brief Surfaces verified claims to the proxy as response headers
 */

namespace jwtgate {
namespace auth {

// Output header name -> claim name
using HeaderMapping = std::map<std::string, std::string>;

using ProjectedHeaders = std::vector<std::pair<std::string, std::string>>;

class HeaderProjector {
 public:
  static constexpr const char* kHeaderPrefix = "headers_";

  explicit HeaderProjector(HeaderMapping static_mapping = {})
      : static_mapping_(std::move(static_mapping)) {}

  /**
   * @brief Merge the static mapping with headers_<name>=<claim> parameters
   *
   * Request parameters replace static entries for the same header. For a
   * repeated parameter the first value wins.
   */
  HeaderMapping mapping_for(const QueryParameters& params) const;

  /**
   * @brief Build header values for every mapped claim present in claims
   *
   * Values are base64 (standard alphabet, padded) of the claim's raw string,
   * or of its compact JSON for arrays and other shapes.
   */
  ProjectedHeaders project(const ClaimSet& claims,
                           const HeaderMapping& mapping) const;

  // Convenience: mapping_for() then project()
  ProjectedHeaders project(const ClaimSet& claims,
                           const QueryParameters& params) const {
    return project(claims, mapping_for(params));
  }

 private:
  HeaderMapping static_mapping_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_HEADER_PROJECTOR_H
