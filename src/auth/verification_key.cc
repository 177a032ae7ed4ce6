#include "jwtgate/auth/verification_key.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

#include "jwtgate/auth/base64.h"
#include "jwtgate/auth/jwks_client.h"

namespace jwtgate {
namespace auth {

namespace {

struct CurveInfo {
  const char* jose_name;
  const char* openssl_group;
  size_t coordinate_size;
};

const CurveInfo kCurves[] = {
    {"P-256", "prime256v1", 32},
    {"P-384", "secp384r1", 48},
    {"P-521", "secp521r1", 66},
};

const CurveInfo* curve_by_jose_name(const std::string& name) {
  for (const auto& c : kCurves) {
    if (name == c.jose_name) {
      return &c;
    }
  }
  return nullptr;
}

const CurveInfo* curve_by_group(const std::string& group) {
  for (const auto& c : kCurves) {
    if (group == c.openssl_group) {
      return &c;
    }
  }
  // OpenSSL may report the NIST alias
  if (group == "P-256") return &kCurves[0];
  if (group == "P-384") return &kCurves[1];
  if (group == "P-521") return &kCurves[2];
  return nullptr;
}

void set_error(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

using ParamBuildPtr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

EVP_PKEY* pkey_from_params(const char* type, const OSSL_PARAM* params) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr),
                 EVP_PKEY_CTX_free);
  if (!ctx) {
    return nullptr;
  }
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
      EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY,
                        const_cast<OSSL_PARAM*>(params)) <= 0) {
    return nullptr;
  }
  return pkey;
}

EVP_PKEY* rsa_from_jwk(const JsonWebKey& jwk, std::string* error) {
  auto n_raw = base64url_decode(jwk.n);
  auto e_raw = base64url_decode(jwk.e);
  if (!n_raw || !e_raw || n_raw->empty() || e_raw->empty()) {
    set_error(error, "RSA key has undecodable n or e");
    return nullptr;
  }

  BignumPtr n(BN_bin2bn(reinterpret_cast<const unsigned char*>(n_raw->data()),
                        static_cast<int>(n_raw->size()), nullptr),
              BN_free);
  BignumPtr e(BN_bin2bn(reinterpret_cast<const unsigned char*>(e_raw->data()),
                        static_cast<int>(e_raw->size()), nullptr),
              BN_free);
  if (!n || !e) {
    set_error(error, "unable to allocate RSA parameters");
    return nullptr;
  }

  ParamBuildPtr build(OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free);
  if (!build || !OSSL_PARAM_BLD_push_BN(build.get(), OSSL_PKEY_PARAM_RSA_N,
                                        n.get()) ||
      !OSSL_PARAM_BLD_push_BN(build.get(), OSSL_PKEY_PARAM_RSA_E, e.get())) {
    set_error(error, "failed to build RSA public key parameters");
    return nullptr;
  }
  ParamPtr params(OSSL_PARAM_BLD_to_param(build.get()), OSSL_PARAM_free);
  if (!params) {
    set_error(error, "failed to build RSA public key parameters");
    return nullptr;
  }

  EVP_PKEY* pkey = pkey_from_params("RSA", params.get());
  if (!pkey) {
    set_error(error, "OpenSSL rejected the RSA public key");
  }
  return pkey;
}

EVP_PKEY* ec_from_jwk(const JsonWebKey& jwk,
                      const CurveInfo& curve,
                      std::string* error) {
  auto x = base64url_decode(jwk.x);
  auto y = base64url_decode(jwk.y);
  if (!x || !y || x->size() != curve.coordinate_size ||
      y->size() != curve.coordinate_size) {
    set_error(error, "EC key coordinates do not match curve " +
                         std::string(curve.jose_name));
    return nullptr;
  }

  // SEC1 uncompressed point: 0x04 || X || Y
  std::string point;
  point.reserve(1 + 2 * curve.coordinate_size);
  point.push_back('\x04');
  point += *x;
  point += *y;

  ParamBuildPtr build(OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free);
  if (!build ||
      !OSSL_PARAM_BLD_push_utf8_string(build.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                       curve.openssl_group, 0) ||
      !OSSL_PARAM_BLD_push_octet_string(build.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                        point.data(), point.size())) {
    set_error(error, "failed to build EC public key parameters");
    return nullptr;
  }
  ParamPtr params(OSSL_PARAM_BLD_to_param(build.get()), OSSL_PARAM_free);
  if (!params) {
    set_error(error, "failed to build EC public key parameters");
    return nullptr;
  }

  // Off-curve points are rejected here
  EVP_PKEY* pkey = pkey_from_params("EC", params.get());
  if (!pkey) {
    set_error(error, "invalid elliptic curve point in key");
  }
  return pkey;
}

}  // namespace

std::shared_ptr<const VerificationKey> VerificationKey::from_jwk(
    const JsonWebKey& jwk, std::string* error) {
  std::shared_ptr<VerificationKey> key(new VerificationKey());
  key->kid_ = jwk.kid;
  key->alg_ = jwk.alg;

  switch (jwk.get_key_type()) {
    case JsonWebKey::KeyType::RSA:
      key->family_ = KeyFamily::RSA;
      key->pkey_.reset(rsa_from_jwk(jwk, error));
      break;
    case JsonWebKey::KeyType::EC: {
      const CurveInfo* curve = curve_by_jose_name(jwk.crv);
      if (!curve) {
        set_error(error, "unsupported curve '" + jwk.crv + "'");
        return nullptr;
      }
      key->family_ = KeyFamily::EC;
      key->curve_ = curve->jose_name;
      key->coordinate_size_ = curve->coordinate_size;
      key->pkey_.reset(ec_from_jwk(jwk, *curve, error));
      break;
    }
    default:
      set_error(error, "unsupported key type '" + jwk.kty + "'");
      return nullptr;
  }

  if (!key->pkey_) {
    return nullptr;
  }
  return key;
}

std::shared_ptr<const VerificationKey> VerificationKey::from_ec_pem(
    const std::string& pem, std::string* error) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
  if (!bio) {
    set_error(error, "unable to allocate buffer for PEM");
    return nullptr;
  }

  std::shared_ptr<VerificationKey> key(new VerificationKey());
  key->pkey_.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
  if (!key->pkey_) {
    set_error(error, "not a PEM encoded public key");
    return nullptr;
  }

  if (!EVP_PKEY_is_a(key->pkey_.get(), "EC")) {
    set_error(error, "public key is not an EC key");
    return nullptr;
  }

  char group[64] = {0};
  size_t group_len = 0;
  if (EVP_PKEY_get_utf8_string_param(key->pkey_.get(),
                                     OSSL_PKEY_PARAM_GROUP_NAME, group,
                                     sizeof(group), &group_len) != 1) {
    set_error(error, "unable to read EC curve");
    return nullptr;
  }
  const CurveInfo* curve = curve_by_group(std::string(group, group_len));
  if (!curve) {
    set_error(error, "unsupported EC curve " + std::string(group, group_len));
    return nullptr;
  }

  key->family_ = KeyFamily::EC;
  key->curve_ = curve->jose_name;
  key->coordinate_size_ = curve->coordinate_size;
  return key;
}

}  // namespace auth
}  // namespace jwtgate
