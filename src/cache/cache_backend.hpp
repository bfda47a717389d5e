#ifndef CACHE_BACKEND_HPP
#define CACHE_BACKEND_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace cache {

// Key/value store with per-entry expiry. Values are serialized results; the
// cache is a performance layer only, so any failure here degrades to a miss.
class ICacheBackend {
public:
  virtual ~ICacheBackend() = default;

  virtual std::optional<std::string> get(const std::string &key) = 0;
  virtual bool set(const std::string &key, std::string value,
                   std::chrono::seconds ttl) = 0;
  virtual bool erase(const std::string &key) = 0;
  // Returns the number of entries removed
  virtual size_t erase_prefix(const std::string &prefix) = 0;
  virtual bool is_healthy() const = 0;
};

} // namespace cache

#endif // CACHE_BACKEND_HPP
