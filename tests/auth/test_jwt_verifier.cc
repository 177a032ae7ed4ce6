#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "auth/test_token_utils.h"
#include "jwtgate/auth/jwt_verifier.h"
#include "mocks/auth_mocks.h"

namespace jwtgate {
namespace auth {
namespace {

using test::MockKeyResolver;
using test_util::make_token;
using test_util::TestSigningKey;
using ::testing::_;
using ::testing::Return;

constexpr int64_t kNow = 1700000000;

class JwtVerifierTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    ec256_ = new TestSigningKey(TestSigningKey::ec("P-256"));
    rsa_ = new TestSigningKey(TestSigningKey::rsa());
  }

  static void TearDownTestSuite() {
    delete ec256_;
    delete rsa_;
    ec256_ = nullptr;
    rsa_ = nullptr;
  }

  TokenVerifier verifier_for(const TestSigningKey& signer,
                             JwtVerifierConfig config = JwtVerifierConfig()) {
    auto resolver =
        std::make_shared<StaticKeyResolver>(signer.verification_key("k1"));
    TokenVerifier verifier(resolver, config);
    verifier.set_clock([]() {
      return std::chrono::system_clock::time_point(std::chrono::seconds(kNow));
    });
    return verifier;
  }

  nlohmann::json payload() {
    return {{"sub", "alice"},
            {"group", nlohmann::json::array({"developers"})},
            {"exp", kNow + 60},
            {"iat", kNow - 60}};
  }

  static TestSigningKey* ec256_;
  static TestSigningKey* rsa_;
};

TestSigningKey* JwtVerifierTest::ec256_ = nullptr;
TestSigningKey* JwtVerifierTest::rsa_ = nullptr;

TEST_F(JwtVerifierTest, AcceptsEs256) {
  auto verifier = verifier_for(*ec256_);
  auto result = verifier.verify(make_token(*ec256_, "ES256", "k1", payload()));

  ASSERT_TRUE(result.valid) << result.error_message;
  EXPECT_EQ(result.error_code, AuthErrorCode::SUCCESS);
  EXPECT_EQ(result.header.alg, "ES256");
  EXPECT_EQ(result.header.kid, "k1");
  EXPECT_EQ(result.header.typ, "JWT");
  ASSERT_NE(result.claims.find("sub"), nullptr);
  EXPECT_EQ(get<ScalarClaim>(*result.claims.find("sub")).value, "alice");
  EXPECT_TRUE(holds_alternative<SequenceClaim>(*result.claims.find("group")));
}

TEST_F(JwtVerifierTest, AcceptsLargerCurves) {
  auto p384 = TestSigningKey::ec("P-384");
  EXPECT_TRUE(
      verifier_for(p384).verify(make_token(p384, "ES384", "k1", payload()))
          .valid);

  auto p521 = TestSigningKey::ec("P-521");
  EXPECT_TRUE(
      verifier_for(p521).verify(make_token(p521, "ES512", "k1", payload()))
          .valid);
}

TEST_F(JwtVerifierTest, AcceptsRsaAlgorithms) {
  auto verifier = verifier_for(*rsa_);
  for (const char* alg : {"RS256", "RS384", "RS512", "PS256", "PS384",
                          "PS512"}) {
    auto result = verifier.verify(make_token(*rsa_, alg, "k1", payload()));
    EXPECT_TRUE(result.valid) << alg << ": " << result.error_message;
  }
}

TEST_F(JwtVerifierTest, RejectsTamperedPayload) {
  auto verifier = verifier_for(*ec256_);
  std::string token = make_token(*ec256_, "ES256", "k1", payload());

  auto forged = payload();
  forged["sub"] = "mallory";
  size_t first = token.find('.');
  size_t second = token.find('.', first + 1);
  std::string tampered = token.substr(0, first + 1) +
                         base64url_encode(forged.dump()) +
                         token.substr(second);

  auto result = verifier.verify(tampered);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error_code, AuthErrorCode::INVALID_SIGNATURE);
  EXPECT_TRUE(result.claims.empty());
}

TEST_F(JwtVerifierTest, RejectsSignatureFromOtherKey) {
  auto other = TestSigningKey::ec("P-256");
  auto result =
      verifier_for(*ec256_).verify(make_token(other, "ES256", "k1", payload()));
  EXPECT_EQ(result.error_code, AuthErrorCode::INVALID_SIGNATURE);
}

TEST_F(JwtVerifierTest, RejectsKeyAlgorithmMismatch) {
  // RSA signature presented to an EC key
  auto result =
      verifier_for(*ec256_).verify(make_token(*rsa_, "RS256", "k1", payload()));
  EXPECT_EQ(result.error_code, AuthErrorCode::INVALID_SIGNATURE);

  // ES384 claimed for a P-256 key
  auto p384 = TestSigningKey::ec("P-384");
  result =
      verifier_for(*ec256_).verify(make_token(p384, "ES384", "k1", payload()));
  EXPECT_EQ(result.error_code, AuthErrorCode::INVALID_SIGNATURE);
}

TEST_F(JwtVerifierTest, RejectsNoneAndHmac) {
  auto verifier = verifier_for(*ec256_);
  std::string body = base64url_encode(payload().dump());

  std::string none = base64url_encode(R"({"alg":"none","kid":"k1"})") + "." +
                     body + ".c2ln";
  EXPECT_EQ(verifier.verify(none).error_code,
            AuthErrorCode::UNSUPPORTED_ALGORITHM);

  std::string hmac = base64url_encode(R"({"alg":"HS256","kid":"k1"})") +
                     "." + body + ".c2ln";
  EXPECT_EQ(verifier.verify(hmac).error_code,
            AuthErrorCode::UNSUPPORTED_ALGORITHM);
}

TEST_F(JwtVerifierTest, MalformedTokens) {
  auto verifier = verifier_for(*ec256_);
  std::string header = base64url_encode(R"({"alg":"ES256","kid":"k1"})");

  for (const std::string& token :
       {std::string(""), std::string("abc"), std::string("a.b"),
        std::string("a..c"), std::string("a.b.c.d"), header + ".e30."}) {
    EXPECT_EQ(verifier.verify(token).error_code,
              AuthErrorCode::MALFORMED_TOKEN)
        << "token: " << token;
  }

  EXPECT_EQ(verifier.verify("!!!.e30.c2ln").error_code,
            AuthErrorCode::MALFORMED_TOKEN);
  EXPECT_EQ(verifier.verify(base64url_encode("[1]") + ".e30.c2ln").error_code,
            AuthErrorCode::MALFORMED_TOKEN);
  EXPECT_EQ(
      verifier.verify(base64url_encode(R"({"kid":"k1"})") + ".e30.c2ln")
          .error_code,
      AuthErrorCode::MALFORMED_TOKEN);
}

TEST_F(JwtVerifierTest, SignedNonObjectPayloadIsMalformed) {
  nlohmann::json header = {{"alg", "ES256"}, {"kid", "k1"}};
  auto token = make_token(header, nlohmann::json::array({1, 2}), *ec256_,
                          "ES256");
  EXPECT_EQ(verifier_for(*ec256_).verify(token).error_code,
            AuthErrorCode::MALFORMED_TOKEN);
}

TEST_F(JwtVerifierTest, ExpiredToken) {
  auto claims = payload();
  claims["exp"] = kNow - 10;
  auto verifier = verifier_for(*ec256_);
  EXPECT_EQ(
      verifier.verify(make_token(*ec256_, "ES256", "k1", claims)).error_code,
      AuthErrorCode::EXPIRED_TOKEN);

  // exp is exclusive
  claims["exp"] = kNow;
  EXPECT_EQ(
      verifier.verify(make_token(*ec256_, "ES256", "k1", claims)).error_code,
      AuthErrorCode::EXPIRED_TOKEN);
}

TEST_F(JwtVerifierTest, ClockSkewExtendsExpiry) {
  JwtVerifierConfig config;
  config.clock_skew = std::chrono::seconds(30);
  auto claims = payload();
  claims["exp"] = kNow - 10;

  EXPECT_TRUE(verifier_for(*ec256_, config)
                  .verify(make_token(*ec256_, "ES256", "k1", claims))
                  .valid);
}

TEST_F(JwtVerifierTest, NotYetValidToken) {
  auto claims = payload();
  claims["nbf"] = kNow + 120;
  EXPECT_EQ(verifier_for(*ec256_)
                .verify(make_token(*ec256_, "ES256", "k1", claims))
                .error_code,
            AuthErrorCode::INVALID_CLAIMS);
}

TEST_F(JwtVerifierTest, IssuedInTheFuture) {
  auto claims = payload();
  claims["iat"] = kNow + 120;
  EXPECT_EQ(verifier_for(*ec256_)
                .verify(make_token(*ec256_, "ES256", "k1", claims))
                .error_code,
            AuthErrorCode::INVALID_CLAIMS);
}

TEST_F(JwtVerifierTest, TimeClaimsMustBeNumeric) {
  auto claims = payload();
  claims["exp"] = "tomorrow";
  EXPECT_EQ(verifier_for(*ec256_)
                .verify(make_token(*ec256_, "ES256", "k1", claims))
                .error_code,
            AuthErrorCode::INVALID_CLAIMS);
}

TEST_F(JwtVerifierTest, TokenWithoutTimeClaimsIsAccepted) {
  nlohmann::json claims = {{"sub", "svc"}};
  EXPECT_TRUE(verifier_for(*ec256_)
                  .verify(make_token(*ec256_, "ES256", "k1", claims))
                  .valid);
}

TEST_F(JwtVerifierTest, KeyResolutionFailureIsReported) {
  auto resolver = std::make_shared<MockKeyResolver>();
  EXPECT_CALL(*resolver, resolve(_))
      .WillOnce(Return(KeyResolution::failure("no key with kid 'k9'")));
  TokenVerifier verifier(resolver);

  auto result = verifier.verify(make_token(*ec256_, "ES256", "k9", payload()));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error_code, AuthErrorCode::KEY_RESOLUTION_ERROR);
  EXPECT_TRUE(result.claims.empty());
}

TEST_F(JwtVerifierTest, UnsupportedAlgorithmNeverReachesResolver) {
  auto resolver = std::make_shared<MockKeyResolver>();
  EXPECT_CALL(*resolver, resolve(_)).Times(0);
  TokenVerifier verifier(resolver);

  std::string token = base64url_encode(R"({"alg":"HS512"})") + ".e30.c2ln";
  EXPECT_EQ(verifier.verify(token).error_code,
            AuthErrorCode::UNSUPPORTED_ALGORITHM);
}

TEST(SignatureAlgorithmTest, ParsesSupportedNames) {
  EXPECT_EQ(*parse_signature_algorithm("ES256"), SignatureAlgorithm::ES256);
  EXPECT_EQ(*parse_signature_algorithm("PS512"), SignatureAlgorithm::PS512);
  EXPECT_FALSE(parse_signature_algorithm("none").has_value());
  EXPECT_FALSE(parse_signature_algorithm("HS256").has_value());
  EXPECT_FALSE(parse_signature_algorithm("es256").has_value());
}

}  // namespace
}  // namespace auth
}  // namespace jwtgate
