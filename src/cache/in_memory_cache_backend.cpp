#include "in_memory_cache_backend.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <mutex>
#include <stdexcept>

namespace cache {

InMemoryCacheBackend::InMemoryCacheBackend(size_t max_entries, Clock clock)
    : max_entries_(max_entries), clock_(std::move(clock)) {
  if (max_entries == 0)
    throw std::invalid_argument("Cache capacity must be greater than 0");
  if (!clock_)
    clock_ = [] { return Utils::get_current_time_ms(); };
}

std::optional<std::string> InMemoryCacheBackend::get(const std::string &key) {
  uint64_t now = clock_();
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (it->second.expires_at_ms <= now) {
    entries_.erase(it);
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  return it->second.value;
}

bool InMemoryCacheBackend::set(const std::string &key, std::string value,
                               std::chrono::seconds ttl) {
  if (ttl.count() <= 0)
    return false;

  uint64_t now = clock_();
  uint64_t expires_at =
      now + static_cast<uint64_t>(ttl.count()) * 1000ULL;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second = Entry{std::move(value), expires_at};
    return true;
  }

  if (entries_.size() >= max_entries_) {
    purge_expired_locked(now);
    if (entries_.size() >= max_entries_)
      evict_one_locked();
  }
  entries_.emplace(key, Entry{std::move(value), expires_at});
  return true;
}

bool InMemoryCacheBackend::erase(const std::string &key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

size_t InMemoryCacheBackend::erase_prefix(const std::string &prefix) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t removed = 0;
  auto it = entries_.lower_bound(prefix);
  while (it != entries_.end() &&
         it->first.compare(0, prefix.size(), prefix) == 0) {
    it = entries_.erase(it);
    ++removed;
  }
  return removed;
}

bool InMemoryCacheBackend::is_healthy() const { return true; }

InMemoryCacheBackend::Stats InMemoryCacheBackend::get_stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return Stats{entries_.size(), hits_, misses_, evictions_};
}

void InMemoryCacheBackend::purge_expired_locked(uint64_t now_ms) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at_ms <= now_ms)
      it = entries_.erase(it);
    else
      ++it;
  }
}

void InMemoryCacheBackend::evict_one_locked() {
  // Drop whichever entry would expire first
  auto victim = entries_.begin();
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->second.expires_at_ms < victim->second.expires_at_ms)
      victim = it;
  }
  if (victim != entries_.end()) {
    LOG(LogLevel::DEBUG, LogComponent::CACHE,
        "Evicting cache entry '" << victim->first << "' at capacity "
                                 << max_entries_);
    entries_.erase(victim);
    ++evictions_;
  }
}

} // namespace cache
