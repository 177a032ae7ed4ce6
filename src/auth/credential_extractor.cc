#include "jwtgate/auth/credential_extractor.h"

namespace jwtgate {
namespace auth {

namespace {

const char* const kWhitespace = " \t";

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

ExtractionResult CredentialExtractor::extract(
    const RequestContext& request) const {
  auto cookie_name = request.query_value(kCookieParameter);
  if (cookie_name && !cookie_name->empty()) {
    // A request may carry several Cookie headers
    for (const auto& h : request.headers) {
      if (!iequals(h.first, "Cookie")) {
        continue;
      }
      auto value = find_cookie(h.second, *cookie_name);
      if (value) {
        if (value->empty()) {
          return ExtractionResult::failure("cookie '" + *cookie_name +
                                           "' is empty");
        }
        return ExtractionResult::success(*value);
      }
    }
    return ExtractionResult::failure("cookie '" + *cookie_name +
                                     "' not present");
  }

  auto authorization = request.header("Authorization");
  if (!authorization) {
    return ExtractionResult::failure("no Authorization header");
  }
  auto token = parse_bearer(*authorization);
  if (!token) {
    return ExtractionResult::failure("Authorization header is not a bearer token");
  }
  return ExtractionResult::success(*token);
}

optional<std::string> CredentialExtractor::find_cookie(
    const std::string& cookie_header, const std::string& name) {
  size_t pos = 0;
  while (pos <= cookie_header.size()) {
    size_t end = cookie_header.find(';', pos);
    if (end == std::string::npos) {
      end = cookie_header.size();
    }
    std::string pair = trim(cookie_header.substr(pos, end - pos));
    size_t eq = pair.find('=');
    if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
      std::string value = trim(pair.substr(eq + 1));
      // Quoted cookie values are allowed by RFC 6265
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return value;
    }
    pos = end + 1;
  }
  return nullopt;
}

optional<std::string> CredentialExtractor::parse_bearer(
    const std::string& authorization) {
  static const std::string kScheme = "bearer";

  std::string value = trim(authorization);
  if (value.size() <= kScheme.size() ||
      !iequals(value.substr(0, kScheme.size()), kScheme)) {
    return nullopt;
  }
  char sep = value[kScheme.size()];
  if (sep != ' ' && sep != '\t') {
    return nullopt;
  }
  std::string token = trim(value.substr(kScheme.size()));
  if (token.empty()) {
    return nullopt;
  }
  return token;
}

}  // namespace auth
}  // namespace jwtgate
