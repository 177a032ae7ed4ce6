#define JWTGATE_LOG_COMPONENT "jwtgate.policy"

#include "jwtgate/auth/pattern_cache.h"

#include <mutex>

#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace auth {

namespace {

std::shared_ptr<const CompiledPattern> compile(const std::string& pattern) {
  auto entry = std::make_shared<CompiledPattern>();
  entry->source = pattern;
  try {
    entry->regex = std::make_unique<const std::regex>(
        pattern, std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& e) {
    entry->error = e.what();
  }
  return entry;
}

}  // namespace

std::shared_ptr<const CompiledPattern> PatternCache::get_or_compile(
    const std::string& pattern) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(pattern);
    if (it != entries_.end()) {
      return it->second;
    }
  }

  // Compile outside the lock; regex construction can be slow
  auto compiled = compile(pattern);
  compile_count_.fetch_add(1, std::memory_order_relaxed);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto result = entries_.emplace(pattern, compiled);
  if (result.second && !compiled->ok()) {
    JWTGATE_LOG(Warning, "invalid claim pattern '{}': {}", pattern,
                compiled->error);
  }
  return result.first->second;
}

size_t PatternCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

void PatternCache::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  compile_count_.store(0, std::memory_order_relaxed);
}

}  // namespace auth
}  // namespace jwtgate
