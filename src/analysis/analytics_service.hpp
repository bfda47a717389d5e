#ifndef ANALYTICS_SERVICE_HPP
#define ANALYTICS_SERVICE_HPP

#include "analysis_types.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "core/health_status.hpp"
#include "correlation_engine.hpp"
#include "frequency_engine.hpp"
#include "series_provider.hpp"
#include "statistical_engine.hpp"
#include "utils/worker_pool.hpp"

#include <functional>
#include <map>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace analysis {

/**
 * Async, cached front for the time-series, statistical, frequency and
 * correlation analyses. Failures resolve the future with success=false.
 */
class AnalyticsService {
public:
  using Clock = std::function<uint64_t()>;

  AnalyticsService(std::shared_ptr<SeriesProvider> series,
                   std::shared_ptr<cache::ResultCache> cache,
                   std::shared_ptr<WorkerPool> pool,
                   std::shared_ptr<const Config::AppConfig> config,
                   Clock clock = nullptr);

  std::future<TimeSeriesData> get_time_series(const std::string &subject_id,
                                              const TimeRange &range,
                                              Granularity granularity);

  // intervals narrow the window to the longest one given; empty means the
  // configured lookback
  std::future<StatisticalAnalysisResult>
  analyze_statistics(const std::string &subject_id,
                     const std::vector<std::string> &intervals = {});

  std::future<FrequencyAnalysisResult>
  analyze_frequency(const std::string &subject_id, const TimeRange &range);

  std::future<CorrelationAnalysisResult>
  analyze_correlation(const std::vector<std::string> &subject_ids,
                      const TimeRange &range);

  std::future<SeasonalityAnalysisResult>
  detect_seasonality(const std::string &subject_id, const TimeRange &range);

  std::future<TimeClusteringResult>
  perform_time_clustering(const std::string &subject_id,
                          const TimeRange &range);

  StatisticalAnalysisResult
  compute_statistics(const std::string &subject_id,
                     const std::vector<std::string> &intervals = {});
  FrequencyAnalysisResult compute_frequency(const std::string &subject_id,
                                            const TimeRange &range);
  CorrelationAnalysisResult
  compute_correlation(const std::vector<std::string> &subject_ids,
                      const TimeRange &range);

  TimeRange lookback_range() const;
  HealthStatus health_status() const;

private:
  Granularity default_granularity() const;

  std::shared_ptr<SeriesProvider> series_;
  std::shared_ptr<cache::ResultCache> cache_;
  std::shared_ptr<WorkerPool> pool_;
  std::shared_ptr<const Config::AppConfig> config_;
  StatisticalEngine statistics_;
  FrequencyEngine frequency_;
  CorrelationEngine correlation_;
  Clock clock_;
};

// Keeps only timestamps present in every series, in time order
std::map<std::string, std::vector<double>>
align_on_common_timestamps(const std::vector<TimeSeriesData> &series);

} // namespace analysis

#endif // ANALYTICS_SERVICE_HPP
