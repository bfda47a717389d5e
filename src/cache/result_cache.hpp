#ifndef RESULT_CACHE_HPP
#define RESULT_CACHE_HPP

#include "cache_backend.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "nlohmann/json.hpp"
#include "utils/json_formatter.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cache {

enum class CacheOperation {
  TIME_SERIES,
  STATISTICAL,
  FREQUENCY,
  CORRELATION,
  PATTERN,
  ANOMALY,
  PREDICTION,
  RECOMMENDATION,
  RANKING,
  EXPLANATION,
  STATS
};

const char *operation_to_string(CacheOperation operation);

std::chrono::seconds ttl_for(const Config::CacheConfig &config,
                             CacheOperation operation);

// Key builders for each namespace. Hashes are stable across runs so keys
// stay valid for shared backends.
namespace CacheKeys {
std::string time_series(const std::string &subject_id,
                        const std::string &range_key,
                        const std::string &granularity);
std::string statistical(const std::string &subject_id,
                        const std::vector<std::string> &intervals);
std::string frequency(const std::string &subject_id,
                      const std::string &range_key);
std::string correlation(const std::vector<std::string> &subject_ids,
                        const std::string &range_key);
std::string device_pattern(const std::string &device_id,
                           const std::vector<std::string> &intervals);
std::string household_pattern(const std::string &household_id,
                              const std::vector<std::string> &intervals);
// Shares the household prefix so household invalidation drops it too
std::string behavioral_model(const std::string &household_id);
std::string anomaly(const std::string &subject_id);
std::string prediction(const std::string &subject_id);
std::string recommendation(const std::string &user_id,
                           const std::string &context_hash);
std::string ranking(const std::string &list_hash,
                    const std::string &preferences_hash);
std::string explanation(const std::string &recommendation_id,
                        const std::string &user_id);
std::string stats(const std::string &user_id, const std::string &range_key);
} // namespace CacheKeys

// Read-through/write-through layer over an ICacheBackend. Only successful
// results are stored; backend and decode failures degrade to a recompute.
class ResultCache {
public:
  ResultCache(std::shared_ptr<ICacheBackend> backend,
              Config::CacheConfig config);

  template <typename T, typename Compute>
  T get_or_compute(CacheOperation operation, const std::string &key,
                   Compute &&compute) {
    if (!config_.enabled)
      return compute();

    const char *op_name = operation_to_string(operation);
    if (auto cached = lookup(key)) {
      try {
        T value = nlohmann::json::parse(*cached).get<T>();
        MetricsRegistry::instance().cache_lookup(op_name, true).Increment();
        LOG(LogLevel::TRACE, LogComponent::CACHE, "Cache hit for " << key);
        return value;
      } catch (const nlohmann::json::exception &e) {
        LOG(LogLevel::WARN, LogComponent::CACHE,
            "Dropping undecodable cache entry " << key << ": " << e.what());
        invalidate(key);
      }
    }
    MetricsRegistry::instance().cache_lookup(op_name, false).Increment();

    T result = compute();
    if (result.success)
      store(key, nlohmann::json(result), ttl_for(config_, operation));
    return result;
  }

  void invalidate(const std::string &key);
  size_t invalidate_prefix(const std::string &prefix);
  bool is_healthy() const;
  const Config::CacheConfig &config() const { return config_; }

private:
  std::optional<std::string> lookup(const std::string &key);
  void store(const std::string &key, const nlohmann::json &value,
             std::chrono::seconds ttl);

  std::shared_ptr<ICacheBackend> backend_;
  Config::CacheConfig config_;
};

} // namespace cache

#endif // RESULT_CACHE_HPP
