#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "jwtgate/auth/claims.h"

namespace jwtgate {
namespace auth {
namespace {

TEST(ClaimSetTest, ClassifiesClaimShapes) {
  auto payload = nlohmann::json::parse(R"({
    "sub": "alice",
    "groups": ["admin", "dev"],
    "empty": [],
    "mixed": ["a", 1],
    "age": 42,
    "active": true,
    "address": {"city": "Oslo"},
    "nothing": null
  })");

  ClaimSet claims = ClaimSet::from_json(payload);
  EXPECT_EQ(claims.size(), 8u);

  ASSERT_TRUE(holds_alternative<ScalarClaim>(*claims.find("sub")));
  EXPECT_EQ(get<ScalarClaim>(*claims.find("sub")).value, "alice");

  ASSERT_TRUE(holds_alternative<SequenceClaim>(*claims.find("groups")));
  EXPECT_EQ(get<SequenceClaim>(*claims.find("groups")).values,
            (std::vector<std::string>{"admin", "dev"}));

  ASSERT_TRUE(holds_alternative<SequenceClaim>(*claims.find("empty")));
  EXPECT_TRUE(get<SequenceClaim>(*claims.find("empty")).values.empty());

  ASSERT_TRUE(holds_alternative<OtherClaim>(*claims.find("mixed")));
  EXPECT_EQ(get<OtherClaim>(*claims.find("mixed")).json, R"(["a",1])");

  EXPECT_EQ(get<OtherClaim>(*claims.find("age")).json, "42");
  EXPECT_EQ(get<OtherClaim>(*claims.find("active")).json, "true");
  EXPECT_EQ(get<OtherClaim>(*claims.find("address")).json,
            R"({"city":"Oslo"})");
  EXPECT_EQ(get<OtherClaim>(*claims.find("nothing")).json, "null");
}

TEST(ClaimSetTest, AbsentClaimIsNull) {
  ClaimSet claims =
      ClaimSet::from_json(nlohmann::json::parse(R"({"sub":"x"})"));
  EXPECT_EQ(claims.find("group"), nullptr);
  EXPECT_FALSE(claims.contains("group"));
  EXPECT_TRUE(claims.contains("sub"));
}

TEST(ClaimSetTest, NonObjectPayloadGivesEmptySet) {
  EXPECT_TRUE(ClaimSet::from_json(nlohmann::json::array()).empty());
  EXPECT_TRUE(ClaimSet::from_json(nlohmann::json("text")).empty());
}

}  // namespace
}  // namespace auth
}  // namespace jwtgate
