#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include <unistd.h>

#include "auth/test_token_utils.h"
#include "jwtgate/server/service_factory.h"

namespace jwtgate {
namespace server {
namespace {

using auth::test_util::make_token;
using auth::test_util::TestSigningKey;

class ServiceFactoryTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!path_.empty()) {
      std::remove(path_.c_str());
    }
  }

  std::string writeKey(const TestSigningKey& key) {
    path_ = "/tmp/jwtgate_factory_" + std::to_string(getpid()) + ".pem";
    std::ofstream out(path_);
    out << key.public_pem();
    return path_;
  }

  auth::RequestContext request(const std::string& token) {
    auth::RequestContext ctx;
    ctx.method = "GET";
    ctx.path = "/validate";
    ctx.uri = "/validate";
    ctx.headers.emplace_back("Authorization", "Bearer " + token);
    return ctx;
  }

  std::string path_;
};

TEST_F(ServiceFactoryTest, NoKeySourceIsFatal) {
  config::ServiceConfig config;
  EXPECT_THROW(createKeyResolver(config), auth::ConfigurationError);
}

TEST_F(ServiceFactoryTest, KeyFileWinsOverUrl) {
  auto signer = TestSigningKey::ec("P-256");
  config::ServiceConfig config;
  config.jwks_path = writeKey(signer);
  // Never contacted because the key file takes precedence
  config.jwks_url = "http://127.0.0.1:1/jwks.json";

  auto resolver = createKeyResolver(config);
  ASSERT_NE(resolver, nullptr);
  EXPECT_TRUE(resolver->resolve(auth::JwtHeader()));
}

TEST_F(ServiceFactoryTest, UnreachableJwksIsFatal) {
  config::ServiceConfig config;
  config.jwks_url = "http://127.0.0.1:1/jwks.json";
  config.jwks_request_timeout = std::chrono::seconds(2);
  EXPECT_THROW(createKeyResolver(config), auth::ConfigurationError);
}

TEST_F(ServiceFactoryTest, ServiceHonorsPolicySettings) {
  auto signer = TestSigningKey::ec("P-256");
  config::ServiceConfig config;
  config.jwks_path = writeKey(signer);
  config.empty_policy = "deny";
  config.response_headers["X-User"] = "sub";

  auto service = createValidationService(config, createKeyResolver(config),
                                         nullptr);
  std::string token = make_token(signer, "ES256", "", {{"sub", "alice"}});

  // No claims_ parameters and a strict empty policy
  EXPECT_EQ(service->handle(request(token)).status, 401);

  auto ctx = request(token);
  ctx.query = {{"claims_sub", "alice"}};
  auto response = service->handle(ctx);
  EXPECT_EQ(response.status, 200);
  ASSERT_EQ(response.headers.size(), 1u);
  EXPECT_EQ(response.headers[0].first, "X-User");
}

TEST_F(ServiceFactoryTest, FullRegexModeAnchors) {
  auto signer = TestSigningKey::ec("P-256");
  config::ServiceConfig config;
  config.jwks_path = writeKey(signer);
  config.regex_match_mode = "full";

  auto service = createValidationService(config, createKeyResolver(config),
                                         nullptr);
  auto ctx = request(make_token(signer, "ES256", "", {{"team", "devops"}}));
  ctx.query = {{"claims_regexp_team", "ops"}};
  EXPECT_EQ(service->handle(ctx).status, 401);

  ctx.query = {{"claims_regexp_team", ".*ops"}};
  EXPECT_EQ(service->handle(ctx).status, 200);
}

}  // namespace
}  // namespace server
}  // namespace jwtgate
