#include "jwtgate/auth/request_context.h"

#include <cctype>

namespace jwtgate {
namespace auth {

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

optional<std::string> RequestContext::query_value(
    const std::string& name) const {
  for (const auto& param : query) {
    if (param.first == name) {
      return param.second;
    }
  }
  return nullopt;
}

optional<std::string> RequestContext::header(const std::string& name) const {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) {
      return h.second;
    }
  }
  return nullopt;
}

}  // namespace auth
}  // namespace jwtgate
