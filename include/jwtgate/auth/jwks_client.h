#ifndef JWTGATE_AUTH_JWKS_CLIENT_H
#define JWTGATE_AUTH_JWKS_CLIENT_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "jwtgate/core/optional.h"

/**
 * @file jwks_client.h
 * @brief JSON Web Key Set model, parsing and retrieval
 */

namespace jwtgate {
namespace auth {

class HttpClient;

/**
 * @brief JSON Web Key representation (RFC 7517)
 */
struct JsonWebKey {
  std::string kid;  // Key ID
  std::string kty;  // Key type (RSA, EC)
  std::string use;  // Key use (sig, enc); empty when absent
  std::string alg;  // Declared algorithm; empty when absent

  // RSA
  std::string n;
  std::string e;

  // EC
  std::string crv;
  std::string x;
  std::string y;

  enum class KeyType { RSA, EC, OCT, UNKNOWN };

  /**
   * @brief Check the key has the members its type requires
   */
  bool is_valid() const;

  /**
   * @brief True unless the key is published for a use other than "sig"
   */
  bool usable_for_signatures() const { return use.empty() || use == "sig"; }

  KeyType get_key_type() const;
};

/**
 * @brief Parse a JWKS document
 * @return All well-formed keys, or nullopt when the document itself is
 *         not JSON or has no "keys" array
 */
optional<std::vector<JsonWebKey>> parse_jwks(const std::string& json);

/**
 * @brief Outcome of one retrieval attempt
 */
struct JwksFetchResult {
  bool success{false};
  std::string body;
  std::string error;

  static JwksFetchResult ok(std::string body) {
    return JwksFetchResult{true, std::move(body), {}};
  }
  static JwksFetchResult failed(std::string error) {
    return JwksFetchResult{false, {}, std::move(error)};
  }
};

/**
 * @brief Where key set documents come from
 */
class JwksSource {
 public:
  virtual ~JwksSource() = default;

  virtual JwksFetchResult fetch() = 0;

  // For log lines
  virtual std::string describe() const = 0;
};

struct JwksClientConfig {
  std::string jwks_uri;
  std::chrono::seconds request_timeout;
  bool verify_ssl;

  JwksClientConfig() : request_timeout(10), verify_ssl(true) {}
};

/**
 * @brief Fetches the key set over HTTP(S)
 */
class HttpJwksSource : public JwksSource {
 public:
  explicit HttpJwksSource(const JwksClientConfig& config,
                          std::shared_ptr<HttpClient> http_client = nullptr);
  ~HttpJwksSource() override;

  JwksFetchResult fetch() override;
  std::string describe() const override { return config_.jwks_uri; }

 private:
  JwksClientConfig config_;
  std::shared_ptr<HttpClient> http_client_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_JWKS_CLIENT_H
