#ifndef JWTGATE_AUTH_VERIFICATION_KEY_H
#define JWTGATE_AUTH_VERIFICATION_KEY_H

#include <memory>
#include <string>

#include <openssl/evp.h>

/**
 * @file verification_key.h
 * @brief Immutable public key used to check token signatures
 */

namespace jwtgate {
namespace auth {

struct JsonWebKey;

enum class KeyFamily { EC, RSA };

/**
 * @brief OpenSSL public key plus the JOSE metadata it was published with
 *
 * Instances are shared by every thread verifying with them and are never
 * modified after construction.
 */
class VerificationKey {
 public:
  /**
   * @brief Convert a JWK (RSA n/e or EC crv/x/y) to an OpenSSL key
   * @param error Receives the reason on failure, may be null
   * @return nullptr when the key is malformed or unsupported
   */
  static std::shared_ptr<const VerificationKey> from_jwk(const JsonWebKey& jwk,
                                                        std::string* error);

  /**
   * @brief Load an EC public key from PEM text (SubjectPublicKeyInfo)
   * @return nullptr when the text is not PEM, not a public key, or not EC
   */
  static std::shared_ptr<const VerificationKey> from_ec_pem(
      const std::string& pem, std::string* error);

  const std::string& kid() const { return kid_; }
  const std::string& alg() const { return alg_; }  // empty when undeclared
  KeyFamily family() const { return family_; }

  // JOSE curve name ("P-256", "P-384", "P-521"); empty for RSA
  const std::string& curve() const { return curve_; }

  // Byte length of one EC coordinate, zero for RSA
  size_t coordinate_size() const { return coordinate_size_; }

  EVP_PKEY* pkey() const { return pkey_.get(); }

 private:
  VerificationKey() : pkey_(nullptr, EVP_PKEY_free) {}

  std::string kid_;
  std::string alg_;
  KeyFamily family_{KeyFamily::EC};
  std::string curve_;
  size_t coordinate_size_{0};
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_;
};

using VerificationKeyPtr = std::shared_ptr<const VerificationKey>;

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_VERIFICATION_KEY_H
