#ifndef JWTGATE_AUTH_KEY_RESOLVER_H
#define JWTGATE_AUTH_KEY_RESOLVER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "jwtgate/auth/auth_types.h"
#include "jwtgate/auth/jwks_client.h"
#include "jwtgate/auth/verification_key.h"
#include "jwtgate/core/optional.h"

/**
 * @file key_resolver.h
 * @brief Selects the public key for a token from its header
 */

namespace jwtgate {
namespace auth {

/**
 * @brief JOSE header members used for key selection
 */
struct JwtHeader {
  std::string alg;  // Algorithm (RS256, ES256, etc.)
  std::string typ;  // Type (JWT)
  std::string kid;  // Key ID, empty when absent
};

struct KeyResolution {
  VerificationKeyPtr key;  // null on failure
  AuthErrorCode error_code{AuthErrorCode::SUCCESS};
  std::string error_message;

  explicit operator bool() const { return key != nullptr; }

  static KeyResolution found(VerificationKeyPtr key) {
    KeyResolution r;
    r.key = std::move(key);
    return r;
  }
  static KeyResolution failure(std::string message) {
    KeyResolution r;
    r.error_code = AuthErrorCode::KEY_RESOLUTION_ERROR;
    r.error_message = std::move(message);
    return r;
  }
};

/**
 * @brief Key lookup strategy
 *
 * resolve() is called concurrently from every worker thread and never
 * blocks on network I/O.
 */
class KeyResolver {
 public:
  virtual ~KeyResolver() = default;

  virtual KeyResolution resolve(const JwtHeader& header) = 0;

  // Stops background work; resolve() keeps answering from current state
  virtual void stop() {}
};

/**
 * @brief A single EC public key loaded from a PEM file at startup
 */
class StaticKeyResolver : public KeyResolver {
 public:
  explicit StaticKeyResolver(VerificationKeyPtr key);

  /**
   * @brief Load the key file
   * @throws ConfigurationError if the file is unreadable or not an EC
   *         public key
   */
  static std::unique_ptr<StaticKeyResolver> from_file(const std::string& path);

  KeyResolution resolve(const JwtHeader& header) override;

 private:
  VerificationKeyPtr key_;
};

/**
 * @brief Immutable key set snapshot, keyed by kid
 */
struct KeySet {
  std::unordered_map<std::string, VerificationKeyPtr> keys;
  std::chrono::system_clock::time_point fetched_at;

  VerificationKeyPtr find(const std::string& kid) const {
    auto it = keys.find(kid);
    return it == keys.end() ? nullptr : it->second;
  }
};

struct JwksResolverConfig {
  std::chrono::seconds refresh_interval;
  bool refresh_unknown_kid;
  std::chrono::seconds refresh_rate_limit;
  bool start_refresh_thread;

  JwksResolverConfig()
      : refresh_interval(3600),
        refresh_unknown_kid(false),
        refresh_rate_limit(300),
        start_refresh_thread(true) {}
};

/**
 * @brief Keys from a remote JWKS with periodic background refresh
 *
 * The current KeySet is published as a shared_ptr swapped atomically;
 * readers never take a lock and keep their snapshot alive for as long as
 * they use it. A failed refresh leaves the previous snapshot in place.
 */
class JwksKeyResolver : public KeyResolver {
 public:
  /**
   * @brief Perform the initial fetch and start the refresh thread
   * @throws ConfigurationError if the initial fetch yields no usable keys
   */
  JwksKeyResolver(std::shared_ptr<JwksSource> source,
                  const JwksResolverConfig& config = JwksResolverConfig());
  ~JwksKeyResolver() override;

  KeyResolution resolve(const JwtHeader& header) override;
  void stop() override;

  /**
   * @brief Fetch and publish a new snapshot now
   * @return false if the fetch or parse failed; the old snapshot is kept
   */
  bool refresh();

  std::shared_ptr<const KeySet> snapshot() const;

  struct Stats {
    size_t refresh_count;    // successful fetches, including the first
    size_t failure_count;
    size_t early_refreshes;  // triggered by unknown kid
    // When the keys now in use were fetched
    std::chrono::system_clock::time_point last_refresh;
  };
  Stats get_stats() const;

 private:
  static std::shared_ptr<const KeySet> build_key_set(const JwksFetchResult& result,
                                                     std::string& error);
  void refresh_loop();
  void request_early_refresh();

  std::shared_ptr<JwksSource> source_;
  JwksResolverConfig config_;

  // Read with std::atomic_load, replaced with std::atomic_store
  std::shared_ptr<const KeySet> key_set_;

  std::thread refresh_thread_;
  std::mutex refresh_mutex_;
  std::condition_variable refresh_cv_;
  bool stopping_{false};
  bool early_refresh_pending_{false};

  // Serializes fetch-and-publish so snapshots are published in order
  std::mutex fetch_mutex_;

  // steady_clock ticks of the last accepted early refresh request
  std::atomic<int64_t> last_early_request_;

  std::atomic<size_t> refresh_count_{0};
  std::atomic<size_t> failure_count_{0};
  std::atomic<size_t> early_refreshes_{0};
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_KEY_RESOLVER_H
