#ifndef JWTGATE_AUTH_PATTERN_CACHE_H
#define JWTGATE_AUTH_PATTERN_CACHE_H

#include <atomic>
#include <memory>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

/**
 * @file pattern_cache.h
 * @brief Process-wide memo of compiled claim regular expressions
 */

namespace jwtgate {
namespace auth {

/**
 * @brief Result of compiling one pattern
 *
 * A failed compilation is cached too, so a bad pattern arriving on every
 * request is compiled (and logged) once.
 */
struct CompiledPattern {
  std::string source;
  std::unique_ptr<const std::regex> regex;  // null when compilation failed
  std::string error;

  bool ok() const { return regex != nullptr; }
};

/**
 * @brief Thread-safe, grow-only pattern cache
 *
 * Lookups take a shared lock; insertion takes the exclusive lock. When two
 * threads compile the same pattern concurrently the first insert is kept.
 * Entries live for the lifetime of the cache; there is no eviction.
 */
class PatternCache {
 public:
  PatternCache() = default;
  PatternCache(const PatternCache&) = delete;
  PatternCache& operator=(const PatternCache&) = delete;

  /**
   * @brief Return the cached entry for pattern, compiling it on first use
   * @return Never null
   */
  std::shared_ptr<const CompiledPattern> get_or_compile(
      const std::string& pattern);

  size_t size() const;

  // Number of std::regex constructions performed
  size_t compile_count() const {
    return compile_count_.load(std::memory_order_relaxed);
  }

  void clear();

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const CompiledPattern>>
      entries_;
  std::atomic<size_t> compile_count_{0};
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_PATTERN_CACHE_H
