#ifndef IN_MEMORY_CACHE_BACKEND_HPP
#define IN_MEMORY_CACHE_BACKEND_HPP

#include "cache_backend.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <shared_mutex>

namespace cache {

class InMemoryCacheBackend : public ICacheBackend {
public:
  using Clock = std::function<uint64_t()>;

  struct Stats {
    size_t entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
  };

  // clock defaults to wall time in ms; tests pass a controllable one
  explicit InMemoryCacheBackend(size_t max_entries = 50000,
                                Clock clock = nullptr);

  std::optional<std::string> get(const std::string &key) override;
  bool set(const std::string &key, std::string value,
           std::chrono::seconds ttl) override;
  bool erase(const std::string &key) override;
  size_t erase_prefix(const std::string &prefix) override;
  bool is_healthy() const override;

  Stats get_stats() const;

private:
  struct Entry {
    std::string value;
    uint64_t expires_at_ms;
  };

  void purge_expired_locked(uint64_t now_ms);
  void evict_one_locked();

  size_t max_entries_;
  Clock clock_;
  // Ordered so prefix erasure is a range walk
  std::map<std::string, Entry> entries_;
  mutable std::shared_mutex mutex_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
};

} // namespace cache

#endif // IN_MEMORY_CACHE_BACKEND_HPP
