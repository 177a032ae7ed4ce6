#include "jwtgate/auth/base64.h"

#include <cstdint>

namespace jwtgate {
namespace auth {

namespace {

const char kStdAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char kUrlAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string encode(const std::string& data, const char* alphabet, bool pad) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  uint32_t val = 0;
  int valb = -6;
  for (unsigned char c : data) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  if (pad) {
    while (out.size() % 4 != 0) {
      out.push_back('=');
    }
  }
  return out;
}

int url_value(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-') return 62;
  if (c == '_') return 63;
  return -1;
}

}  // namespace

std::string base64_encode(const std::string& data) {
  return encode(data, kStdAlphabet, true);
}

std::string base64url_encode(const std::string& data) {
  return encode(data, kUrlAlphabet, false);
}

optional<std::string> base64url_decode(const std::string& encoded) {
  std::string input = encoded;
  while (!input.empty() && input.back() == '=') {
    input.pop_back();
  }
  // A single leftover sextet cannot encode a byte
  if (input.size() % 4 == 1) {
    return nullopt;
  }

  std::string decoded;
  decoded.reserve(input.size() * 3 / 4);

  uint32_t val = 0;
  int valb = -8;
  for (unsigned char c : input) {
    int v = url_value(c);
    if (v < 0) {
      return nullopt;
    }
    val = (val << 6) + static_cast<uint32_t>(v);
    valb += 6;
    if (valb >= 0) {
      decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return decoded;
}

}  // namespace auth
}  // namespace jwtgate
