#define JWTGATE_LOG_COMPONENT "jwtgate.keys"

#include "jwtgate/auth/key_resolver.h"

#include <fstream>
#include <limits>
#include <sstream>

#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

constexpr int64_t kNeverRequested = std::numeric_limits<int64_t>::min();

int64_t steady_now_ticks() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

// StaticKeyResolver

StaticKeyResolver::StaticKeyResolver(VerificationKeyPtr key)
    : key_(std::move(key)) {
  if (!key_) {
    throw ConfigurationError("static key resolver requires a key");
  }
}

std::unique_ptr<StaticKeyResolver> StaticKeyResolver::from_file(
    const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw ConfigurationError("cannot read key file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string error;
  auto key = VerificationKey::from_ec_pem(buffer.str(), &error);
  if (!key) {
    throw ConfigurationError("invalid key file " + path + ": " + error);
  }

  JWTGATE_LOG(Info, "loaded static {} public key from {}", key->curve(), path);
  return std::make_unique<StaticKeyResolver>(std::move(key));
}

KeyResolution StaticKeyResolver::resolve(const JwtHeader&) {
  return KeyResolution::found(key_);
}

// JwksKeyResolver

JwksKeyResolver::JwksKeyResolver(std::shared_ptr<JwksSource> source,
                                 const JwksResolverConfig& config)
    : source_(std::move(source)),
      config_(config),
      last_early_request_(kNeverRequested) {
  if (!source_) {
    throw ConfigurationError("JWKS resolver requires a key source");
  }

  std::string error;
  auto initial = build_key_set(source_->fetch(), error);
  if (!initial) {
    throw ConfigurationError("initial JWKS fetch from " + source_->describe() +
                             " failed: " + error);
  }
  std::atomic_store(&key_set_, initial);
  refresh_count_.fetch_add(1, std::memory_order_relaxed);
  JWTGATE_LOG(Info, "loaded {} keys from {}", initial->keys.size(),
              source_->describe());

  if (config_.start_refresh_thread) {
    refresh_thread_ = std::thread([this]() { refresh_loop(); });
  }
}

JwksKeyResolver::~JwksKeyResolver() {
  stop();
}

void JwksKeyResolver::stop() {
  {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    stopping_ = true;
  }
  refresh_cv_.notify_all();
  if (refresh_thread_.joinable()) {
    refresh_thread_.join();
  }
}

KeyResolution JwksKeyResolver::resolve(const JwtHeader& header) {
  if (header.kid.empty()) {
    return KeyResolution::failure("token header has no kid");
  }

  auto keys = snapshot();
  auto key = keys->find(header.kid);
  if (!key) {
    if (config_.refresh_unknown_kid) {
      request_early_refresh();
    }
    return KeyResolution::failure("no key with kid '" + header.kid + "'");
  }

  if (!key->alg().empty() && key->alg() != header.alg) {
    return KeyResolution::failure("key '" + header.kid + "' is for " +
                                  key->alg() + ", token uses " + header.alg);
  }

  return KeyResolution::found(std::move(key));
}

bool JwksKeyResolver::refresh() {
  std::lock_guard<std::mutex> lock(fetch_mutex_);

  std::string error;
  auto next = build_key_set(source_->fetch(), error);
  if (!next) {
    failure_count_.fetch_add(1, std::memory_order_relaxed);
    auto current = snapshot();
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - current->fetched_at);
    JWTGATE_LOG(Warning,
                "JWKS refresh from {} failed, keeping {} cached keys fetched "
                "{}s ago: {}",
                source_->describe(), current->keys.size(), age.count(), error);
    return false;
  }

  std::atomic_store(&key_set_, next);
  refresh_count_.fetch_add(1, std::memory_order_relaxed);
  JWTGATE_LOG(Debug, "refreshed {} keys from {}", next->keys.size(),
              source_->describe());
  return true;
}

std::shared_ptr<const KeySet> JwksKeyResolver::snapshot() const {
  return std::atomic_load(&key_set_);
}

JwksKeyResolver::Stats JwksKeyResolver::get_stats() const {
  Stats stats;
  stats.refresh_count = refresh_count_.load(std::memory_order_relaxed);
  stats.failure_count = failure_count_.load(std::memory_order_relaxed);
  stats.early_refreshes = early_refreshes_.load(std::memory_order_relaxed);
  stats.last_refresh = snapshot()->fetched_at;
  return stats;
}

std::shared_ptr<const KeySet> JwksKeyResolver::build_key_set(
    const JwksFetchResult& result, std::string& error) {
  if (!result.success) {
    error = result.error;
    return nullptr;
  }

  auto jwks = parse_jwks(result.body);
  if (!jwks) {
    error = "response is not a JWKS document";
    return nullptr;
  }

  auto set = std::make_shared<KeySet>();
  set->fetched_at = std::chrono::system_clock::now();
  for (const auto& jwk : *jwks) {
    if (!jwk.usable_for_signatures()) {
      continue;
    }
    if (jwk.kid.empty()) {
      JWTGATE_LOG(Debug, "skipping {} key without kid", jwk.kty);
      continue;
    }
    std::string key_error;
    auto key = VerificationKey::from_jwk(jwk, &key_error);
    if (!key) {
      JWTGATE_LOG(Warning, "skipping key '{}': {}", jwk.kid, key_error);
      continue;
    }
    set->keys.emplace(jwk.kid, std::move(key));
  }

  if (set->keys.empty()) {
    error = "no usable signing keys";
    return nullptr;
  }
  return set;
}

void JwksKeyResolver::request_early_refresh() {
  const int64_t now = steady_now_ticks();
  const int64_t limit_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.refresh_rate_limit)
          .count();

  int64_t last = last_early_request_.load(std::memory_order_relaxed);
  if (last != kNeverRequested && now - last < limit_ms) {
    return;
  }
  // Only one racing caller wins the slot
  if (!last_early_request_.compare_exchange_strong(last, now)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    early_refresh_pending_ = true;
  }
  refresh_cv_.notify_one();
  JWTGATE_LOG(Info, "unknown kid, scheduling early JWKS refresh");
}

void JwksKeyResolver::refresh_loop() {
  std::unique_lock<std::mutex> lock(refresh_mutex_);
  while (!stopping_) {
    refresh_cv_.wait_for(lock, config_.refresh_interval, [this]() {
      return stopping_ || early_refresh_pending_;
    });
    if (stopping_) {
      break;
    }
    bool early = early_refresh_pending_;
    early_refresh_pending_ = false;

    lock.unlock();
    if (early) {
      early_refreshes_.fetch_add(1, std::memory_order_relaxed);
    }
    refresh();
    lock.lock();
  }
}

}  // namespace auth
}  // namespace jwtgate
