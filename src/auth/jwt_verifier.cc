#include "jwtgate/auth/jwt_verifier.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <nlohmann/json.hpp>

#include "jwtgate/auth/base64.h"

namespace jwtgate {
namespace auth {

namespace {

struct AlgorithmInfo {
  const char* name;
  SignatureAlgorithm alg;
  KeyFamily family;
  const char* curve;  // required EC curve, null for RSA
  bool pss;
};

const AlgorithmInfo kAlgorithms[] = {
    {"ES256", SignatureAlgorithm::ES256, KeyFamily::EC, "P-256", false},
    {"ES384", SignatureAlgorithm::ES384, KeyFamily::EC, "P-384", false},
    {"ES512", SignatureAlgorithm::ES512, KeyFamily::EC, "P-521", false},
    {"RS256", SignatureAlgorithm::RS256, KeyFamily::RSA, nullptr, false},
    {"RS384", SignatureAlgorithm::RS384, KeyFamily::RSA, nullptr, false},
    {"RS512", SignatureAlgorithm::RS512, KeyFamily::RSA, nullptr, false},
    {"PS256", SignatureAlgorithm::PS256, KeyFamily::RSA, nullptr, true},
    {"PS384", SignatureAlgorithm::PS384, KeyFamily::RSA, nullptr, true},
    {"PS512", SignatureAlgorithm::PS512, KeyFamily::RSA, nullptr, true},
};

const AlgorithmInfo* find_algorithm(const std::string& name) {
  for (const auto& info : kAlgorithms) {
    if (name == info.name) {
      return &info;
    }
  }
  return nullptr;
}

const EVP_MD* digest_for(SignatureAlgorithm alg) {
  switch (alg) {
    case SignatureAlgorithm::ES256:
    case SignatureAlgorithm::RS256:
    case SignatureAlgorithm::PS256:
      return EVP_sha256();
    case SignatureAlgorithm::ES384:
    case SignatureAlgorithm::RS384:
    case SignatureAlgorithm::PS384:
      return EVP_sha384();
    case SignatureAlgorithm::ES512:
    case SignatureAlgorithm::RS512:
    case SignatureAlgorithm::PS512:
      return EVP_sha512();
  }
  return nullptr;
}

bool split_token(const std::string& token,
                 std::string& header_b64,
                 std::string& payload_b64,
                 std::string& signature_b64) {
  size_t first = token.find('.');
  if (first == std::string::npos) {
    return false;
  }
  size_t second = token.find('.', first + 1);
  if (second == std::string::npos ||
      token.find('.', second + 1) != std::string::npos) {
    return false;
  }

  header_b64 = token.substr(0, first);
  payload_b64 = token.substr(first + 1, second - first - 1);
  signature_b64 = token.substr(second + 1);
  return !header_b64.empty() && !payload_b64.empty() && !signature_b64.empty();
}

// JWS carries ECDSA signatures as fixed-width r||s; OpenSSL wants DER
bool ecdsa_raw_to_der(const std::string& raw,
                      size_t coordinate_size,
                      std::string& der) {
  if (raw.size() != 2 * coordinate_size) {
    return false;
  }
  const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());

  std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(),
                                                            ECDSA_SIG_free);
  BIGNUM* r = BN_bin2bn(bytes, static_cast<int>(coordinate_size), nullptr);
  BIGNUM* s = BN_bin2bn(bytes + coordinate_size,
                        static_cast<int>(coordinate_size), nullptr);
  if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return false;
  }
  // sig now owns r and s

  int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return false;
  }
  der.resize(static_cast<size_t>(len));
  auto* out = reinterpret_cast<unsigned char*>(&der[0]);
  return i2d_ECDSA_SIG(sig.get(), &out) == len;
}

bool verify_signature(const AlgorithmInfo& alg,
                      const VerificationKey& key,
                      const std::string& signing_input,
                      const std::string& signature) {
  std::string der;
  const std::string* sig = &signature;
  if (alg.family == KeyFamily::EC) {
    if (!ecdsa_raw_to_der(signature, key.coordinate_size(), der)) {
      return false;
    }
    sig = &der;
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md_ctx(
      EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!md_ctx) {
    return false;
  }

  EVP_PKEY_CTX* pkey_ctx = nullptr;  // owned by md_ctx
  if (EVP_DigestVerifyInit(md_ctx.get(), &pkey_ctx, digest_for(alg.alg),
                           nullptr, key.pkey()) != 1) {
    return false;
  }

  if (alg.pss) {
    if (EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, RSA_PSS_SALTLEN_DIGEST) <=
            0) {
      return false;
    }
  }

  return EVP_DigestVerify(
             md_ctx.get(), reinterpret_cast<const unsigned char*>(sig->data()),
             sig->size(),
             reinterpret_cast<const unsigned char*>(signing_input.data()),
             signing_input.size()) == 1;
}

}  // namespace

optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& alg) {
  const AlgorithmInfo* info = find_algorithm(alg);
  if (!info) {
    return nullopt;
  }
  return info->alg;
}

TokenVerifier::TokenVerifier(std::shared_ptr<KeyResolver> resolver,
                             const JwtVerifierConfig& config)
    : resolver_(std::move(resolver)),
      config_(config),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

JwtVerificationResult TokenVerifier::verify(const std::string& token) const {
  // Step 1: Split
  std::string header_b64, payload_b64, signature_b64;
  if (!split_token(token, header_b64, payload_b64, signature_b64)) {
    return JwtVerificationResult::failure(
        AuthErrorCode::MALFORMED_TOKEN, "token is not three non-empty segments");
  }

  // Step 2: Header
  auto header_json = base64url_decode(header_b64);
  if (!header_json) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "header is not base64url");
  }
  auto header = nlohmann::json::parse(*header_json, nullptr, false);
  if (header.is_discarded() || !header.is_object()) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "header is not a JSON object");
  }

  JwtHeader jwt_header;
  auto alg_it = header.find("alg");
  if (alg_it == header.end() || !alg_it->is_string()) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "header has no alg");
  }
  jwt_header.alg = alg_it->get<std::string>();

  auto kid_it = header.find("kid");
  if (kid_it != header.end()) {
    if (!kid_it->is_string()) {
      return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                            "header kid is not a string");
    }
    jwt_header.kid = kid_it->get<std::string>();
  }
  auto typ_it = header.find("typ");
  if (typ_it != header.end() && typ_it->is_string()) {
    jwt_header.typ = typ_it->get<std::string>();
  }

  const AlgorithmInfo* alg = find_algorithm(jwt_header.alg);
  if (!alg) {
    return JwtVerificationResult::failure(
        AuthErrorCode::UNSUPPORTED_ALGORITHM,
        "algorithm '" + jwt_header.alg + "' is not accepted");
  }

  // Step 3: Key
  KeyResolution resolution = resolver_->resolve(jwt_header);
  if (!resolution) {
    return JwtVerificationResult::failure(resolution.error_code,
                                          resolution.error_message);
  }
  const VerificationKey& key = *resolution.key;

  // Step 4: Signature
  if (key.family() != alg->family ||
      (alg->curve != nullptr && key.curve() != alg->curve)) {
    return JwtVerificationResult::failure(
        AuthErrorCode::INVALID_SIGNATURE,
        "key cannot verify " + jwt_header.alg + " signatures");
  }

  auto signature = base64url_decode(signature_b64);
  if (!signature) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "signature is not base64url");
  }

  const std::string signing_input = header_b64 + "." + payload_b64;
  if (!verify_signature(*alg, key, signing_input, *signature)) {
    return JwtVerificationResult::failure(AuthErrorCode::INVALID_SIGNATURE,
                                          "signature verification failed");
  }

  // Step 5: Payload
  auto payload_json = base64url_decode(payload_b64);
  if (!payload_json) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "payload is not base64url");
  }
  auto payload = nlohmann::json::parse(*payload_json, nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    return JwtVerificationResult::failure(AuthErrorCode::MALFORMED_TOKEN,
                                          "payload is not a JSON object");
  }

  // Step 6: Time claims
  const double now = static_cast<double>(
      std::chrono::duration_cast<std::chrono::seconds>(
          clock_().time_since_epoch())
          .count());
  const double skew = static_cast<double>(config_.clock_skew.count());

  for (const char* name : {"exp", "nbf", "iat"}) {
    auto it = payload.find(name);
    if (it != payload.end() && !it->is_number()) {
      return JwtVerificationResult::failure(
          AuthErrorCode::INVALID_CLAIMS,
          std::string(name) + " claim is not numeric");
    }
  }

  auto exp_it = payload.find("exp");
  if (exp_it != payload.end() && now >= exp_it->get<double>() + skew) {
    return JwtVerificationResult::failure(AuthErrorCode::EXPIRED_TOKEN,
                                          "token is expired");
  }
  auto nbf_it = payload.find("nbf");
  if (nbf_it != payload.end() && now + skew < nbf_it->get<double>()) {
    return JwtVerificationResult::failure(AuthErrorCode::INVALID_CLAIMS,
                                          "token is not valid yet");
  }
  auto iat_it = payload.find("iat");
  if (iat_it != payload.end() && now + skew < iat_it->get<double>()) {
    return JwtVerificationResult::failure(AuthErrorCode::INVALID_CLAIMS,
                                          "token issued in the future");
  }

  // Step 7: Claims
  JwtVerificationResult result;
  result.valid = true;
  result.error_code = AuthErrorCode::SUCCESS;
  result.header = std::move(jwt_header);
  result.claims = ClaimSet::from_json(payload);
  return result;
}

}  // namespace auth
}  // namespace jwtgate
