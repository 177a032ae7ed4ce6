#include <gtest/gtest.h>

#include "auth/test_token_utils.h"
#include "jwtgate/auth/jwks_client.h"
#include "jwtgate/auth/verification_key.h"

namespace jwtgate {
namespace auth {
namespace {

using test_util::TestSigningKey;

TEST(JwksParseTest, ParseValidJwks) {
  std::string valid_jwks = R"({
    "keys": [
      {
        "kid": "test-key-1",
        "kty": "RSA",
        "use": "sig",
        "alg": "RS256",
        "n": "xGOr-H7A-PWG3z",
        "e": "AQAB"
      },
      {
        "kid": "test-key-2",
        "kty": "EC",
        "crv": "P-256",
        "x": "WKn-ZIGevcwG",
        "y": "IueRXDLkwZkj"
      }
    ]
  })";

  auto keys = parse_jwks(valid_jwks);
  ASSERT_TRUE(keys.has_value());
  ASSERT_EQ(keys->size(), 2u);

  EXPECT_EQ((*keys)[0].kid, "test-key-1");
  EXPECT_EQ((*keys)[0].get_key_type(), JsonWebKey::KeyType::RSA);
  EXPECT_EQ((*keys)[0].alg, "RS256");
  EXPECT_TRUE((*keys)[0].usable_for_signatures());

  EXPECT_EQ((*keys)[1].kid, "test-key-2");
  EXPECT_EQ((*keys)[1].get_key_type(), JsonWebKey::KeyType::EC);
  EXPECT_TRUE((*keys)[1].use.empty());
  EXPECT_TRUE((*keys)[1].usable_for_signatures());
}

TEST(JwksParseTest, SkipsMalformedAndSymmetricKeys) {
  auto keys = parse_jwks(R"({"keys":[
    {"kid":"a","kty":"RSA","n":"abc"},
    {"kid":"b","kty":"oct","k":"c2VjcmV0"},
    "not an object",
    {"kid":"c","kty":"EC","crv":"P-256","x":"eA","y":"eQ"}
  ]})");
  ASSERT_TRUE(keys.has_value());
  ASSERT_EQ(keys->size(), 1u);
  EXPECT_EQ((*keys)[0].kid, "c");
}

TEST(JwksParseTest, RejectsDocumentsWithoutKeyArray) {
  EXPECT_FALSE(parse_jwks("not json").has_value());
  EXPECT_FALSE(parse_jwks("[]").has_value());
  EXPECT_FALSE(parse_jwks(R"({"keys":{}})").has_value());
  EXPECT_FALSE(parse_jwks(R"({"other":[]})").has_value());

  auto empty = parse_jwks(R"({"keys":[]})");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(JwksParseTest, EncryptionKeysAreNotForSignatures) {
  JsonWebKey key;
  key.use = "enc";
  EXPECT_FALSE(key.usable_for_signatures());
}

TEST(VerificationKeyTest, ConvertsEcJwk) {
  auto signer = TestSigningKey::ec("P-256");
  std::string error;
  auto key = VerificationKey::from_jwk(signer.jwk("ec-1", "ES256"), &error);

  ASSERT_NE(key, nullptr) << error;
  EXPECT_EQ(key->kid(), "ec-1");
  EXPECT_EQ(key->alg(), "ES256");
  EXPECT_EQ(key->family(), KeyFamily::EC);
  EXPECT_EQ(key->curve(), "P-256");
  EXPECT_EQ(key->coordinate_size(), 32u);
  EXPECT_NE(key->pkey(), nullptr);
}

TEST(VerificationKeyTest, ConvertsP521Jwk) {
  auto signer = TestSigningKey::ec("P-521");
  std::string error;
  auto key = VerificationKey::from_jwk(signer.jwk("ec-521"), &error);
  ASSERT_NE(key, nullptr) << error;
  EXPECT_EQ(key->coordinate_size(), 66u);
}

TEST(VerificationKeyTest, ConvertsRsaJwk) {
  auto signer = TestSigningKey::rsa();
  std::string error;
  auto key = VerificationKey::from_jwk(signer.jwk("rsa-1"), &error);

  ASSERT_NE(key, nullptr) << error;
  EXPECT_EQ(key->family(), KeyFamily::RSA);
  EXPECT_TRUE(key->curve().empty());
  EXPECT_TRUE(key->alg().empty());
}

TEST(VerificationKeyTest, RejectsCoordinateLengthMismatch) {
  auto signer = TestSigningKey::ec("P-256");
  JsonWebKey jwk = signer.jwk("ec-1");
  jwk.crv = "P-384";

  std::string error;
  EXPECT_EQ(VerificationKey::from_jwk(jwk, &error), nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(VerificationKeyTest, RejectsUnknownCurveAndBadEncoding) {
  auto signer = TestSigningKey::ec("P-256");
  JsonWebKey jwk = signer.jwk("ec-1");
  jwk.crv = "secp256k1";
  EXPECT_EQ(VerificationKey::from_jwk(jwk, nullptr), nullptr);

  JsonWebKey bad = signer.jwk("ec-2");
  bad.x = "not*base64url";
  EXPECT_EQ(VerificationKey::from_jwk(bad, nullptr), nullptr);
}

TEST(VerificationKeyTest, RejectsPointNotOnCurve) {
  auto signer = TestSigningKey::ec("P-256");
  JsonWebKey jwk = signer.jwk("ec-1");
  jwk.y = base64url_encode(std::string(32, '\x01'));
  EXPECT_EQ(VerificationKey::from_jwk(jwk, nullptr), nullptr);
}

TEST(VerificationKeyTest, LoadsEcPem) {
  auto signer = TestSigningKey::ec("P-384");
  std::string error;
  auto key = VerificationKey::from_ec_pem(signer.public_pem(), &error);

  ASSERT_NE(key, nullptr) << error;
  EXPECT_EQ(key->family(), KeyFamily::EC);
  EXPECT_EQ(key->curve(), "P-384");
}

TEST(VerificationKeyTest, PemMustBeEcPublicKey) {
  std::string error;
  EXPECT_EQ(VerificationKey::from_ec_pem("garbage", &error), nullptr);
  EXPECT_FALSE(error.empty());

  auto rsa = TestSigningKey::rsa();
  EXPECT_EQ(VerificationKey::from_ec_pem(rsa.public_pem(), nullptr), nullptr);
}

TEST(HttpJwksSourceTest, UnreachableEndpointFails) {
  JwksClientConfig config;
  config.jwks_uri = "http://127.0.0.1:1/jwks.json";
  config.request_timeout = std::chrono::seconds(2);

  HttpJwksSource source(config);
  auto result = source.fetch();
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
  EXPECT_EQ(source.describe(), config.jwks_uri);
}

}  // namespace
}  // namespace auth
}  // namespace jwtgate
