#ifndef JWTGATE_AUTH_BASE64_H
#define JWTGATE_AUTH_BASE64_H

#include <string>

#include "jwtgate/core/optional.h"

namespace jwtgate {
namespace auth {

// Standard alphabet, padded (RFC 4648 section 4)
std::string base64_encode(const std::string& data);

// URL-safe alphabet, unpadded, as used in compact JWS
std::string base64url_encode(const std::string& data);

/**
 * @brief Decode base64url; trailing padding is tolerated
 * @return nullopt on any character outside the alphabet or a bad length
 */
optional<std::string> base64url_decode(const std::string& encoded);

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_BASE64_H
