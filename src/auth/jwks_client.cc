#define JWTGATE_LOG_COMPONENT "jwtgate.keys"

#include "jwtgate/auth/jwks_client.h"

#include <nlohmann/json.hpp>

#include "jwtgate/auth/http_client.h"
#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

// Copies a string member; non-string values are treated as absent
void read_member(const nlohmann::json& obj,
                 const char* name,
                 std::string& out) {
  auto it = obj.find(name);
  if (it != obj.end() && it->is_string()) {
    out = it->get<std::string>();
  }
}

}  // namespace

bool JsonWebKey::is_valid() const {
  if (kty.empty()) {
    return false;
  }

  if (kty == "RSA") {
    return !n.empty() && !e.empty();
  } else if (kty == "EC") {
    return !crv.empty() && !x.empty() && !y.empty();
  }

  // Symmetric and unknown key types cannot verify asymmetric signatures
  return false;
}

JsonWebKey::KeyType JsonWebKey::get_key_type() const {
  if (kty == "RSA") return KeyType::RSA;
  if (kty == "EC") return KeyType::EC;
  if (kty == "oct") return KeyType::OCT;
  return KeyType::UNKNOWN;
}

optional<std::vector<JsonWebKey>> parse_jwks(const std::string& json) {
  auto j = nlohmann::json::parse(json, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return nullopt;
  }

  auto keys_it = j.find("keys");
  if (keys_it == j.end() || !keys_it->is_array()) {
    return nullopt;
  }

  std::vector<JsonWebKey> keys;
  for (const auto& key_json : *keys_it) {
    if (!key_json.is_object()) {
      continue;
    }
    JsonWebKey key;

    read_member(key_json, "kid", key.kid);
    read_member(key_json, "kty", key.kty);
    read_member(key_json, "use", key.use);
    read_member(key_json, "alg", key.alg);

    read_member(key_json, "n", key.n);
    read_member(key_json, "e", key.e);

    read_member(key_json, "crv", key.crv);
    read_member(key_json, "x", key.x);
    read_member(key_json, "y", key.y);

    if (key.is_valid()) {
      keys.push_back(std::move(key));
    } else {
      JWTGATE_LOG(Debug, "skipping malformed JWK kid='{}' kty='{}'", key.kid,
                  key.kty);
    }
  }

  return keys;
}

HttpJwksSource::HttpJwksSource(const JwksClientConfig& config,
                               std::shared_ptr<HttpClient> http_client)
    : config_(config), http_client_(std::move(http_client)) {
  if (!http_client_) {
    http_client_ = std::make_shared<HttpClient>();
  }
}

HttpJwksSource::~HttpJwksSource() = default;

JwksFetchResult HttpJwksSource::fetch() {
  HttpRequest request;
  request.url = config_.jwks_uri;
  request.timeout = config_.request_timeout;
  request.verify_ssl = config_.verify_ssl;
  request.headers["Accept"] = "application/json";

  auto response = http_client_->request(request);
  if (!response.error.empty()) {
    return JwksFetchResult::failed(response.error);
  }
  if (response.status_code != 200) {
    return JwksFetchResult::failed("unexpected HTTP status " +
                                   std::to_string(response.status_code));
  }

  JWTGATE_LOG(Debug, "fetched key set from {} in {}ms", config_.jwks_uri,
              response.latency.count());
  return JwksFetchResult::ok(std::move(response.body));
}

}  // namespace auth
}  // namespace jwtgate
