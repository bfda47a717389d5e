#ifndef SYNTHETIC_SERIES_HPP
#define SYNTHETIC_SERIES_HPP

#include "analysis/analytics_service.hpp"
#include "analysis/pattern_engine.hpp"
#include "analysis/series_provider.hpp"
#include "cache/in_memory_cache_backend.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "ingest/time_series_source.hpp"
#include "utils/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace testing_fixtures {

constexpr uint64_t HOUR_MS = 3600000ULL;
constexpr uint64_t BASE_MS = 1704067200000ULL; // 2024-01-01T00:00:00Z
constexpr double PI = 3.14159265358979323846;

// In-memory source with seeded generators and an injectable fetch failure
class SyntheticSeriesSource : public ingest::ITimeSeriesSource {
public:
  void add_series(const std::string &subject,
                  std::vector<TimeSeriesPoint> points) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_[subject] = std::move(points);
  }

  void add_household(const std::string &household,
                     std::vector<std::string> devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::sort(devices.begin(), devices.end());
    households_[household] = std::move(devices);
  }

  void fail_fetches(bool fail) { fail_ = fail; }
  size_t fetch_count() const { return fetches_.load(); }

  std::vector<TimeSeriesPoint> fetch(const std::string &subject_id,
                                     uint64_t start_ms, uint64_t end_ms,
                                     Granularity granularity) override {
    fetches_++;
    if (fail_)
      throw std::runtime_error("synthetic source offline");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(subject_id);
    if (it == series_.end())
      return {};
    std::vector<TimeSeriesPoint> in_range;
    for (const auto &point : it->second) {
      if (point.timestamp_ms >= start_ms && point.timestamp_ms <= end_ms)
        in_range.push_back(point);
    }
    return ingest::bucket_points(in_range, granularity);
  }

  std::vector<std::string>
  devices_in_household(const std::string &household_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = households_.find(household_id);
    return it == households_.end() ? std::vector<std::string>{} : it->second;
  }

  std::string source_label() const override { return "synthetic"; }

private:
  std::mutex mutex_;
  std::map<std::string, std::vector<TimeSeriesPoint>> series_;
  std::map<std::string, std::vector<std::string>> households_;
  std::atomic<bool> fail_{false};
  std::atomic<size_t> fetches_{0};
};

// Hourly samples following a 24h cosine peaking at peak_hour
inline std::vector<TimeSeriesPoint>
daily_cycle(size_t hours, double base, double amplitude, int peak_hour,
            double noise_sd, unsigned seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> noise(0.0, noise_sd > 0 ? noise_sd : 1.0);
  std::vector<TimeSeriesPoint> points;
  points.reserve(hours);
  for (size_t h = 0; h < hours; ++h) {
    double phase = 2.0 * PI * (static_cast<double>(h % 24) - peak_hour) / 24.0;
    double value = base + amplitude * std::cos(phase);
    if (noise_sd > 0)
      value += noise(rng);
    points.push_back(
        TimeSeriesPoint{BASE_MS + h * HOUR_MS, value, "power", "watts"});
  }
  return points;
}

inline std::vector<TimeSeriesPoint> constant_series(size_t hours,
                                                    double value) {
  std::vector<TimeSeriesPoint> points;
  for (size_t h = 0; h < hours; ++h)
    points.push_back(
        TimeSeriesPoint{BASE_MS + h * HOUR_MS, value, "power", "watts"});
  return points;
}

// Wires source, cache, pool and services the way main() does, with the
// clock pinned just after the last synthetic hour
struct AnalysisHarness {
  explicit AnalysisHarness(size_t hours_of_data = 24 * 14)
      : now_ms(BASE_MS + hours_of_data * HOUR_MS) {
    auto app = std::make_shared<Config::AppConfig>();
    app->worker_threads = 2;
    app->default_lookback_hours = static_cast<uint32_t>(hours_of_data);
    config = app;

    source = std::make_shared<SyntheticSeriesSource>();
    backend = std::make_shared<cache::InMemoryCacheBackend>(
        1000, [this] { return now_ms.load(); });
    cache = std::make_shared<cache::ResultCache>(backend, config->cache);
    pool = std::make_shared<WorkerPool>(config->worker_threads);
    series = std::make_shared<analysis::SeriesProvider>(source, cache);
    auto clock = [this] { return now_ms.load(); };
    analytics = std::make_shared<analysis::AnalyticsService>(
        series, cache, pool, config, clock);
    patterns = std::make_shared<analysis::PatternEngine>(series, cache, pool,
                                                         config, clock);
  }

  ~AnalysisHarness() { pool->shutdown(); }

  std::atomic<uint64_t> now_ms;
  std::shared_ptr<const Config::AppConfig> config;
  std::shared_ptr<SyntheticSeriesSource> source;
  std::shared_ptr<cache::InMemoryCacheBackend> backend;
  std::shared_ptr<cache::ResultCache> cache;
  std::shared_ptr<WorkerPool> pool;
  std::shared_ptr<analysis::SeriesProvider> series;
  std::shared_ptr<analysis::AnalyticsService> analytics;
  std::shared_ptr<analysis::PatternEngine> patterns;
};

} // namespace testing_fixtures

#endif // SYNTHETIC_SERIES_HPP
