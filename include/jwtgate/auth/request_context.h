#ifndef JWTGATE_AUTH_REQUEST_CONTEXT_H
#define JWTGATE_AUTH_REQUEST_CONTEXT_H

#include <string>
#include <utility>
#include <vector>

#include "jwtgate/core/optional.h"

/**
 * @file request_context.h
 * @brief Transport-independent view of a subrequest
 */

namespace jwtgate {
namespace auth {

// Decoded query parameters in arrival order; names may repeat
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Everything the validation pipeline reads from an HTTP request
 */
struct RequestContext {
  std::string method;
  std::string path;
  std::string uri;  // path plus raw query, for logging
  QueryParameters query;
  HeaderList headers;

  /**
   * @brief First value of a query parameter
   */
  optional<std::string> query_value(const std::string& name) const;

  /**
   * @brief First value of a header, name compared case-insensitively
   */
  optional<std::string> header(const std::string& name) const;
};

bool iequals(const std::string& a, const std::string& b);

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_REQUEST_CONTEXT_H
