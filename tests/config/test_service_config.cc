#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <unistd.h>

#include "jwtgate/config/service_config.h"

namespace jwtgate {
namespace config {
namespace {

const char* const kEnvironment[] = {
    "PORT",     "WORKERS",  "LOG_LEVEL",          "LOG_FORMAT",
    "JWKS_PATH", "JWKS_URL", "INSECURE_SKIP_VERIFY", "JWKS_REFRESH_INTERVAL",
    "JWTGATE_CONFIG"};

class ServiceConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearEnvironment(); }

  void TearDown() override {
    clearEnvironment();
    if (!path_.empty()) {
      std::remove(path_.c_str());
    }
  }

  static void clearEnvironment() {
    for (const char* name : kEnvironment) {
      unsetenv(name);
    }
  }

  std::string writeFile(const std::string& content) {
    path_ = "/tmp/jwtgate_config_" + std::to_string(getpid()) + ".yaml";
    std::ofstream out(path_);
    out << content;
    return path_;
  }

  std::string path_;
};

TEST_F(ServiceConfigTest, DefaultsNeedAKeySource) {
  ServiceConfig config;
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.insecure_skip_verify);
  EXPECT_EQ(config.jwks_refresh_interval, std::chrono::seconds(3600));

  try {
    loadServiceConfig();
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("JWKS_URL"), std::string::npos);
  }
}

TEST_F(ServiceConfigTest, ReadsEnvironment) {
  setenv("PORT", "9090", 1);
  setenv("WORKERS", "4", 1);
  setenv("LOG_LEVEL", "DEBUG", 1);
  setenv("JWKS_URL", "https://issuer.example/.well-known/jwks.json", 1);
  setenv("INSECURE_SKIP_VERIFY", "true", 1);
  setenv("JWKS_REFRESH_INTERVAL", "15m", 1);

  auto config = loadServiceConfig();
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.workers, 4u);
  EXPECT_EQ(config.effectiveWorkers(), 4u);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.jwks_url, "https://issuer.example/.well-known/jwks.json");
  EXPECT_TRUE(config.insecure_skip_verify);
  EXPECT_EQ(config.jwks_refresh_interval, std::chrono::seconds(900));
}

TEST_F(ServiceConfigTest, InsecureFlagOnlyHonorsTrue) {
  setenv("JWKS_URL", "https://issuer.example/jwks", 1);
  setenv("INSECURE_SKIP_VERIFY", "yes", 1);
  EXPECT_FALSE(loadServiceConfig().insecure_skip_verify);
}

TEST_F(ServiceConfigTest, EmptyVariablesAreUnset) {
  setenv("JWKS_PATH", "/etc/jwtgate/key.pem", 1);
  setenv("PORT", "", 1);
  EXPECT_EQ(loadServiceConfig().port, 8080);
}

TEST_F(ServiceConfigTest, NonNumericPortIsFatal) {
  setenv("JWKS_PATH", "/etc/jwtgate/key.pem", 1);
  setenv("PORT", "http", 1);
  EXPECT_THROW(loadServiceConfig(), ConfigurationError);

  setenv("PORT", "70000", 1);
  EXPECT_THROW(loadServiceConfig(), ConfigurationError);
}

TEST_F(ServiceConfigTest, LoadsYamlFile) {
  auto path = writeFile(R"(
port: 7000
log_format: json
jwks_url: https://issuer.example/jwks
jwks_request_timeout: 3s
refresh_unknown_kid: true
clock_skew: 30
regex_match_mode: full
empty_policy: deny
response_headers:
  X-User: sub
  X-Groups: group
)");

  auto config = loadServiceConfig(path);
  EXPECT_EQ(config.port, 7000);
  EXPECT_EQ(config.log_format, "json");
  EXPECT_EQ(config.jwks_request_timeout, std::chrono::seconds(3));
  EXPECT_TRUE(config.refresh_unknown_kid);
  EXPECT_EQ(config.clock_skew, std::chrono::seconds(30));
  EXPECT_EQ(config.regex_match_mode, "full");
  EXPECT_EQ(config.empty_policy, "deny");
  ASSERT_EQ(config.response_headers.size(), 2u);
  EXPECT_EQ(config.response_headers.at("X-User"), "sub");
}

TEST_F(ServiceConfigTest, EnvironmentOverridesFile) {
  auto path = writeFile("port: 7000\njwks_path: /etc/key.pem\n");
  setenv("PORT", "7001", 1);

  auto config = loadServiceConfig(path);
  EXPECT_EQ(config.port, 7001);
  EXPECT_EQ(config.jwks_path, "/etc/key.pem");
}

TEST_F(ServiceConfigTest, ConfigPathFromEnvironment) {
  auto path = writeFile("jwks_path: /etc/key.pem\nworkers: 2\n");
  setenv("JWTGATE_CONFIG", path.c_str(), 1);
  EXPECT_EQ(loadServiceConfig().workers, 2u);
}

TEST_F(ServiceConfigTest, MissingOrBrokenFileIsFatal) {
  EXPECT_THROW(loadServiceConfig("/nonexistent/jwtgate.yaml"),
               ConfigurationError);

  auto path = writeFile("port: [unclosed\n");
  try {
    loadServiceConfig(path);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("line"), std::string::npos);
  }

  writeFile("- just\n- a list\n");
  EXPECT_THROW(loadServiceConfig(path), ConfigurationError);
}

TEST_F(ServiceConfigTest, ValidateRejectsBadValues) {
  ServiceConfig config;
  config.jwks_url = "https://issuer.example/jwks";
  EXPECT_NO_THROW(config.validate());

  auto bad = config;
  bad.log_level = "chatty";
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.log_format = "xml";
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.regex_match_mode = "anchored";
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.empty_policy = "maybe";
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.jwks_refresh_interval = std::chrono::seconds(0);
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.response_headers["X-Empty"] = "";
  EXPECT_THROW(bad.validate(), ConfigurationError);
}

TEST_F(ServiceConfigTest, ValidateBoundsDurations) {
  ServiceConfig config;
  config.jwks_url = "https://issuer.example/jwks";
  config.jwks_refresh_interval = ServiceConfig::kMaxDuration;
  config.refresh_rate_limit = ServiceConfig::kMaxDuration;
  EXPECT_NO_THROW(config.validate());

  const auto huge = std::chrono::seconds(
      std::numeric_limits<std::chrono::seconds::rep>::max() / 2);

  auto bad = config;
  bad.jwks_refresh_interval = huge;
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.refresh_rate_limit = huge;
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.jwks_request_timeout =
      ServiceConfig::kMaxDuration + std::chrono::seconds(1);
  EXPECT_THROW(bad.validate(), ConfigurationError);

  bad = config;
  bad.clock_skew = huge;
  EXPECT_THROW(bad.validate(), ConfigurationError);

  // Parsed values go through the same check
  EXPECT_THROW(configFromJson({{"jwks_url", "https://issuer.example/jwks"},
                               {"refresh_rate_limit", "9999999h"}})
                   .validate(),
               ConfigurationError);
}

TEST_F(ServiceConfigTest, ConfigFromJsonTypeErrors) {
  EXPECT_THROW(configFromJson({{"port", "abc"}}), ConfigurationError);
  EXPECT_THROW(configFromJson({{"workers", -1}}), ConfigurationError);
  EXPECT_THROW(configFromJson({{"insecure_skip_verify", 1}}),
               ConfigurationError);
  EXPECT_THROW(configFromJson({{"clock_skew", "soon"}}), ConfigurationError);
  EXPECT_THROW(configFromJson({{"response_headers", {{"X-User", 1}}}}),
               ConfigurationError);
  EXPECT_THROW(configFromJson(nlohmann::json::array()), ConfigurationError);

  // Unknown keys are only warned about
  EXPECT_NO_THROW(configFromJson({{"listen_backlog", 128}}));
}

TEST_F(ServiceConfigTest, MergeHonorsPriority) {
  std::vector<std::unique_ptr<ConfigSource>> sources;
  sources.push_back(std::make_unique<StaticConfigSource>(
      "override", nlohmann::json{{"port", 1}}));
  sources.push_back(std::make_unique<StaticConfigSource>(
      "file", nlohmann::json{{"port", 2}, {"workers", 3}},
      ConfigSource::FILE));

  auto merged = mergeSources(sources);
  EXPECT_EQ(merged["port"], 1);
  EXPECT_EQ(merged["workers"], 3);
}

TEST(DurationTest, ParsesUnits) {
  std::chrono::seconds out{0};
  ASSERT_TRUE(parseDuration("45", out));
  EXPECT_EQ(out.count(), 45);
  ASSERT_TRUE(parseDuration("30s", out));
  EXPECT_EQ(out.count(), 30);
  ASSERT_TRUE(parseDuration("5m", out));
  EXPECT_EQ(out.count(), 300);
  ASSERT_TRUE(parseDuration("1h", out));
  EXPECT_EQ(out.count(), 3600);
  ASSERT_TRUE(parseDuration("1500ms", out));
  EXPECT_EQ(out.count(), 2);

  EXPECT_FALSE(parseDuration("", out));
  EXPECT_FALSE(parseDuration("-5s", out));
  EXPECT_FALSE(parseDuration("5d", out));
  EXPECT_FALSE(parseDuration("h", out));
  EXPECT_FALSE(parseDuration("99999999999999999999h", out));
}

TEST(YamlToJsonTest, TypesPlainScalars) {
  auto json = yamlToJson(R"(
count: 3
ratio: 0.5
enabled: true
name: jwtgate
quoted: "8080"
flag: 'false'
nothing: ~
list: [a, 1]
)");

  EXPECT_TRUE(json["count"].is_number_integer());
  EXPECT_TRUE(json["ratio"].is_number_float());
  EXPECT_EQ(json["enabled"], true);
  EXPECT_EQ(json["name"], "jwtgate");
  EXPECT_EQ(json["quoted"], "8080");
  EXPECT_EQ(json["flag"], "false");
  EXPECT_TRUE(json["nothing"].is_null());
  EXPECT_EQ(json["list"], nlohmann::json::array({"a", 1}));
}

}  // namespace
}  // namespace config
}  // namespace jwtgate
