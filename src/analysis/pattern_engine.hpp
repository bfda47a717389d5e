#ifndef PATTERN_ENGINE_HPP
#define PATTERN_ENGINE_HPP

#include "analysis_types.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "core/health_status.hpp"
#include "series_provider.hpp"
#include "statistical_engine.hpp"
#include "utils/worker_pool.hpp"

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace analysis {

/**
 * Device and household behavioural patterns, residual anomalies and short
 * horizon forecasts over the configured lookback window.
 *
 * Every query is cached under its own namespace and TTL. The async entry
 * points run on the shared worker pool; the compute_* forms run on the
 * calling thread and are what the async forms schedule.
 */
class PatternEngine {
public:
  using Clock = std::function<uint64_t()>;

  // clock anchors the lookback window; defaults to wall time
  PatternEngine(std::shared_ptr<SeriesProvider> series,
                std::shared_ptr<cache::ResultCache> cache,
                std::shared_ptr<WorkerPool> pool,
                std::shared_ptr<const Config::AppConfig> config,
                Clock clock = nullptr);

  std::future<PatternAnalysisResult>
  analyze_device_patterns(const std::string &device_id,
                          const std::vector<std::string> &intervals = {});
  std::future<PatternAnalysisResult>
  analyze_household_patterns(const std::string &household_id,
                             const std::vector<std::string> &intervals = {});
  std::future<BehavioralModelResult>
  build_behavioral_model(const std::string &household_id);
  std::future<PatternAnalysisResult>
  detect_anomalies(const std::string &subject_id);
  std::future<PatternAnalysisResult>
  generate_predictions(const std::string &subject_id);

  PatternAnalysisResult
  compute_device_patterns(const std::string &device_id,
                          const std::vector<std::string> &intervals = {});
  PatternAnalysisResult
  compute_household_patterns(const std::string &household_id,
                             const std::vector<std::string> &intervals = {});
  BehavioralModelResult
  compute_behavioral_model(const std::string &household_id);
  PatternAnalysisResult compute_anomalies(const std::string &subject_id);
  PatternAnalysisResult compute_predictions(const std::string &subject_id);

  void clear_device_cache(const std::string &device_id);
  void clear_household_cache(const std::string &household_id);

  HealthStatus health_status() const;

private:
  TimeRange lookback_range() const;
  TimeSeriesData load_hourly(const std::string &subject_id);
  PatternAnalysisResult new_result(const std::string &subject_id) const;
  void fail(PatternAnalysisResult &result, const char *operation,
            const std::string &message) const;
  double sufficiency(size_t samples) const;

  PatternAnalysisResult
  device_patterns_uncached(const std::string &device_id,
                           const std::vector<std::string> &intervals);
  PatternAnalysisResult
  household_patterns_uncached(const std::string &household_id,
                              const std::vector<std::string> &intervals);
  BehavioralModelResult
  behavioral_model_uncached(const std::string &household_id);
  PatternAnalysisResult anomalies_uncached(const std::string &subject_id);
  PatternAnalysisResult predictions_uncached(const std::string &subject_id);

  std::vector<TimeIntervalPattern>
  interval_patterns(const std::vector<TimeSeriesPoint> &points,
                    const std::vector<std::string> &intervals,
                    uint64_t window_end_ms) const;

  std::shared_ptr<SeriesProvider> series_;
  std::shared_ptr<cache::ResultCache> cache_;
  std::shared_ptr<WorkerPool> pool_;
  std::shared_ptr<const Config::AppConfig> config_;
  StatisticalEngine statistics_;
  Clock clock_;
};

} // namespace analysis

#endif // PATTERN_ENGINE_HPP
