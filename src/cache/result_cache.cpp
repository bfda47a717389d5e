#include "result_cache.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace cache {

const char *operation_to_string(CacheOperation operation) {
  switch (operation) {
  case CacheOperation::TIME_SERIES:
    return "timeseries";
  case CacheOperation::STATISTICAL:
    return "statistical";
  case CacheOperation::FREQUENCY:
    return "frequency";
  case CacheOperation::CORRELATION:
    return "correlation";
  case CacheOperation::PATTERN:
    return "pattern";
  case CacheOperation::ANOMALY:
    return "anomaly";
  case CacheOperation::PREDICTION:
    return "prediction";
  case CacheOperation::RECOMMENDATION:
    return "recommendation";
  case CacheOperation::RANKING:
    return "ranking";
  case CacheOperation::EXPLANATION:
    return "explanation";
  case CacheOperation::STATS:
    return "stats";
  }
  return "unknown";
}

std::chrono::seconds ttl_for(const Config::CacheConfig &config,
                             CacheOperation operation) {
  uint32_t seconds = 0;
  switch (operation) {
  case CacheOperation::TIME_SERIES:
    seconds = config.time_series_ttl_seconds;
    break;
  case CacheOperation::STATISTICAL:
    seconds = config.statistical_ttl_seconds;
    break;
  case CacheOperation::FREQUENCY:
    seconds = config.frequency_ttl_seconds;
    break;
  case CacheOperation::CORRELATION:
    seconds = config.correlation_ttl_seconds;
    break;
  case CacheOperation::PATTERN:
    seconds = config.pattern_ttl_seconds;
    break;
  case CacheOperation::ANOMALY:
    seconds = config.anomaly_ttl_seconds;
    break;
  case CacheOperation::PREDICTION:
    seconds = config.prediction_ttl_seconds;
    break;
  case CacheOperation::RECOMMENDATION:
    seconds = config.recommendation_ttl_seconds;
    break;
  case CacheOperation::RANKING:
    seconds = config.ranking_ttl_seconds;
    break;
  case CacheOperation::EXPLANATION:
    seconds = config.explanation_ttl_seconds;
    break;
  case CacheOperation::STATS:
    seconds = config.stats_ttl_seconds;
    break;
  }
  return std::chrono::seconds(seconds);
}

namespace CacheKeys {

namespace {
std::string hash_of(const std::vector<std::string> &parts) {
  return Utils::hash_to_hex(Utils::stable_hash(parts));
}

std::string sorted_hash_of(std::vector<std::string> parts) {
  std::sort(parts.begin(), parts.end());
  return hash_of(parts);
}
} // namespace

std::string time_series(const std::string &subject_id,
                        const std::string &range_key,
                        const std::string &granularity) {
  return "timeseries:" + subject_id + ":" + hash_of({range_key, granularity});
}

std::string statistical(const std::string &subject_id,
                        const std::vector<std::string> &intervals) {
  return "statistical:" + subject_id + ":" + hash_of(intervals);
}

std::string frequency(const std::string &subject_id,
                      const std::string &range_key) {
  return "frequency:" + subject_id + ":" + range_key;
}

std::string correlation(const std::vector<std::string> &subject_ids,
                        const std::string &range_key) {
  // Subject order does not change the analysis
  return "correlation:" + sorted_hash_of(subject_ids) + ":" + range_key;
}

std::string device_pattern(const std::string &device_id,
                           const std::vector<std::string> &intervals) {
  return "pattern:device:" + device_id + ":" + hash_of(intervals);
}

std::string household_pattern(const std::string &household_id,
                              const std::vector<std::string> &intervals) {
  return "pattern:household:" + household_id + ":" + hash_of(intervals);
}

std::string behavioral_model(const std::string &household_id) {
  return "pattern:household:" + household_id + ":model";
}

std::string anomaly(const std::string &subject_id) {
  return "anomaly:" + subject_id;
}

std::string prediction(const std::string &subject_id) {
  return "prediction:" + subject_id;
}

std::string recommendation(const std::string &user_id,
                           const std::string &context_hash) {
  return "recommendation:" + user_id + ":" + context_hash;
}

std::string ranking(const std::string &list_hash,
                    const std::string &preferences_hash) {
  return "ranking:" + list_hash + ":" + preferences_hash;
}

std::string explanation(const std::string &recommendation_id,
                        const std::string &user_id) {
  return "explanation:" + recommendation_id + ":" + user_id;
}

std::string stats(const std::string &user_id, const std::string &range_key) {
  return "stats:" + user_id + ":" + range_key;
}

} // namespace CacheKeys

ResultCache::ResultCache(std::shared_ptr<ICacheBackend> backend,
                         Config::CacheConfig config)
    : backend_(std::move(backend)), config_(std::move(config)) {
  if (!backend_)
    throw std::invalid_argument("ResultCache requires a cache backend");
}

std::optional<std::string> ResultCache::lookup(const std::string &key) {
  try {
    return backend_->get(key);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CACHE,
        "Cache read failed for " << key << ": " << e.what());
    return std::nullopt;
  }
}

void ResultCache::store(const std::string &key, const nlohmann::json &value,
                        std::chrono::seconds ttl) {
  try {
    if (!backend_->set(key, JsonFormatter::to_cache_string(value), ttl)) {
      LOG(LogLevel::DEBUG, LogComponent::CACHE,
          "Cache backend declined write for " << key);
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CACHE,
        "Cache write failed for " << key << ": " << e.what());
  }
}

void ResultCache::invalidate(const std::string &key) {
  try {
    backend_->erase(key);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CACHE,
        "Cache erase failed for " << key << ": " << e.what());
  }
}

size_t ResultCache::invalidate_prefix(const std::string &prefix) {
  try {
    size_t removed = backend_->erase_prefix(prefix);
    LOG(LogLevel::DEBUG, LogComponent::CACHE,
        "Invalidated " << removed << " entries under " << prefix);
    return removed;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CACHE,
        "Cache prefix erase failed for " << prefix << ": " << e.what());
    return 0;
  }
}

bool ResultCache::is_healthy() const {
  try {
    return backend_->is_healthy();
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CACHE,
        "Cache health probe failed: " << e.what());
    return false;
  }
}

} // namespace cache
