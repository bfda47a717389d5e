#include "analytics_service.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace analysis {

namespace {
constexpr uint64_t HOUR_MS = 3600ULL * 1000;

void record_failure(const char *operation, const std::string &subject,
                    const std::string &message) {
  LOG(LogLevel::ERROR, LogComponent::ANALYSIS_STATS,
      operation << " failed for " << subject << ": " << message);
  MetricsRegistry::instance().operation_failure(operation).Increment();
}
} // namespace

std::map<std::string, std::vector<double>>
align_on_common_timestamps(const std::vector<TimeSeriesData> &series) {
  std::map<std::string, std::vector<double>> aligned;

  std::set<uint64_t> common;
  bool first = true;
  for (const auto &data : series) {
    if (data.points.empty())
      continue;
    std::set<uint64_t> stamps;
    for (const auto &p : data.points)
      stamps.insert(p.timestamp_ms);
    if (first) {
      common = std::move(stamps);
      first = false;
      continue;
    }
    std::set<uint64_t> both;
    std::set_intersection(common.begin(), common.end(), stamps.begin(),
                          stamps.end(), std::inserter(both, both.begin()));
    common = std::move(both);
  }

  for (const auto &data : series) {
    auto &values = aligned[data.subject_id];
    for (const auto &p : data.points) {
      if (common.count(p.timestamp_ms))
        values.push_back(p.value);
    }
  }
  return aligned;
}

AnalyticsService::AnalyticsService(
    std::shared_ptr<SeriesProvider> series,
    std::shared_ptr<cache::ResultCache> cache, std::shared_ptr<WorkerPool> pool,
    std::shared_ptr<const Config::AppConfig> config, Clock clock)
    : series_(std::move(series)), cache_(std::move(cache)),
      pool_(std::move(pool)), config_(std::move(config)),
      statistics_(config_ ? config_->statistics : Config::StatisticsConfig{}),
      frequency_(config_ ? config_->frequency : Config::FrequencyConfig{}),
      correlation_(config_ ? config_->correlation
                           : Config::CorrelationConfig{}),
      clock_(std::move(clock)) {
  if (!series_ || !cache_ || !pool_ || !config_)
    throw std::invalid_argument(
        "AnalyticsService requires a series provider, cache, pool and config");
  if (!clock_)
    clock_ = [] { return Utils::get_current_time_ms(); };
}

Granularity AnalyticsService::default_granularity() const {
  return parse_granularity(config_->default_granularity)
      .value_or(Granularity::HOURLY);
}

TimeRange AnalyticsService::lookback_range() const {
  uint64_t end = clock_();
  uint64_t span =
      static_cast<uint64_t>(config_->default_lookback_hours) * HOUR_MS;
  return TimeRange{end > span ? end - span : 0, end};
}

std::future<TimeSeriesData>
AnalyticsService::get_time_series(const std::string &subject_id,
                                  const TimeRange &range,
                                  Granularity granularity) {
  return pool_->submit([this, subject_id, range, granularity] {
    return series_->load(subject_id, range, granularity);
  });
}

std::future<StatisticalAnalysisResult>
AnalyticsService::analyze_statistics(const std::string &subject_id,
                                     const std::vector<std::string> &intervals) {
  return pool_->submit([this, subject_id, intervals] {
    return compute_statistics(subject_id, intervals);
  });
}

std::future<FrequencyAnalysisResult>
AnalyticsService::analyze_frequency(const std::string &subject_id,
                                    const TimeRange &range) {
  return pool_->submit(
      [this, subject_id, range] { return compute_frequency(subject_id, range); });
}

std::future<CorrelationAnalysisResult>
AnalyticsService::analyze_correlation(const std::vector<std::string> &subject_ids,
                                      const TimeRange &range) {
  return pool_->submit([this, subject_ids, range] {
    return compute_correlation(subject_ids, range);
  });
}

StatisticalAnalysisResult
AnalyticsService::compute_statistics(const std::string &subject_id,
                                     const std::vector<std::string> &intervals) {
  auto key = cache::CacheKeys::statistical(subject_id, intervals);
  return cache_->get_or_compute<StatisticalAnalysisResult>(
      cache::CacheOperation::STATISTICAL, key, [&] {
        ScopedTimer timer(
            MetricsRegistry::instance().operation_duration("statistical"));
        StatisticalAnalysisResult result;
        result.subject_id = subject_id;
        try {
          TimeRange range = lookback_range();
          uint64_t longest = 0;
          for (const auto &label : intervals) {
            if (auto duration = Utils::parse_duration_ms(label))
              longest = std::max(longest, *duration);
          }
          if (longest > 0)
            range.start_ms = range.end_ms > longest ? range.end_ms - longest : 0;

          auto data = series_->load(subject_id, range, default_granularity());
          if (!data.success) {
            record_failure("statistical", subject_id, data.error_message);
            result.success = false;
            result.error_message = data.error_message;
          } else {
            result = statistics_.analyze(subject_id, data.points);
          }
        } catch (const std::exception &e) {
          record_failure("statistical", subject_id, e.what());
          result = StatisticalAnalysisResult{};
          result.subject_id = subject_id;
          result.success = false;
          result.error_message = e.what();
        }
        result.processing_time_ms = timer.elapsed_ms();
        return result;
      });
}

FrequencyAnalysisResult
AnalyticsService::compute_frequency(const std::string &subject_id,
                                    const TimeRange &range) {
  auto key = cache::CacheKeys::frequency(subject_id, range.to_key());
  return cache_->get_or_compute<FrequencyAnalysisResult>(
      cache::CacheOperation::FREQUENCY, key, [&] {
        ScopedTimer timer(
            MetricsRegistry::instance().operation_duration("frequency"));
        FrequencyAnalysisResult result;
        result.subject_id = subject_id;
        try {
          auto data = series_->load(subject_id, range, default_granularity());
          if (!data.success) {
            record_failure("frequency", subject_id, data.error_message);
            result.success = false;
            result.error_message = data.error_message;
          } else {
            result = frequency_.analyze(subject_id, data.values());
          }
        } catch (const std::exception &e) {
          record_failure("frequency", subject_id, e.what());
          result = FrequencyAnalysisResult{};
          result.subject_id = subject_id;
          result.success = false;
          result.error_message = e.what();
        }
        result.processing_time_ms = timer.elapsed_ms();
        return result;
      });
}

CorrelationAnalysisResult
AnalyticsService::compute_correlation(const std::vector<std::string> &subject_ids,
                                      const TimeRange &range) {
  auto key = cache::CacheKeys::correlation(subject_ids, range.to_key());
  return cache_->get_or_compute<CorrelationAnalysisResult>(
      cache::CacheOperation::CORRELATION, key, [&] {
        ScopedTimer timer(
            MetricsRegistry::instance().operation_duration("correlation"));
        CorrelationAnalysisResult result;
        result.range = range;
        try {
          std::vector<TimeSeriesData> loaded;
          std::set<std::string> unique(subject_ids.begin(), subject_ids.end());
          for (const auto &subject : unique) {
            auto data = series_->load(subject, range, default_granularity());
            if (!data.success)
              throw std::runtime_error("series for " + subject +
                                       " unavailable: " + data.error_message);
            loaded.push_back(std::move(data));
          }
          result = correlation_.analyze(align_on_common_timestamps(loaded),
                                        range);
        } catch (const std::exception &e) {
          LOG(LogLevel::ERROR, LogComponent::ANALYSIS_CORRELATION,
              "Correlation failed: " << e.what());
          MetricsRegistry::instance().operation_failure("correlation").Increment();
          result = CorrelationAnalysisResult{};
          result.range = range;
          result.subject_ids = subject_ids;
          result.success = false;
          result.error_message = e.what();
        }
        result.processing_time_ms = timer.elapsed_ms();
        return result;
      });
}

std::future<SeasonalityAnalysisResult>
AnalyticsService::detect_seasonality(const std::string &subject_id,
                                     const TimeRange &range) {
  return pool_->submit([this, subject_id, range] {
    ScopedTimer timer(
        MetricsRegistry::instance().operation_duration("seasonality"));
    SeasonalityAnalysisResult result;
    result.subject_id = subject_id;
    try {
      auto data = series_->load(subject_id, range, default_granularity());
      if (!data.success) {
        record_failure("seasonality", subject_id, data.error_message);
        result.success = false;
        result.error_message = data.error_message;
      } else {
        auto values = data.values();
        result.sample_count = values.size();
        result.seasonality = statistics_.detect_seasonality(values);
      }
    } catch (const std::exception &e) {
      record_failure("seasonality", subject_id, e.what());
      result.success = false;
      result.error_message = e.what();
    }
    result.processing_time_ms = timer.elapsed_ms();
    return result;
  });
}

std::future<TimeClusteringResult>
AnalyticsService::perform_time_clustering(const std::string &subject_id,
                                          const TimeRange &range) {
  return pool_->submit([this, subject_id, range] {
    ScopedTimer timer(
        MetricsRegistry::instance().operation_duration("time_clustering"));
    TimeClusteringResult result;
    result.subject_id = subject_id;
    try {
      auto data = series_->load(subject_id, range, default_granularity());
      if (!data.success) {
        record_failure("time_clustering", subject_id, data.error_message);
        result.success = false;
        result.error_message = data.error_message;
      } else {
        result.sample_count = data.points.size();
        result.clusters = statistics_.cluster(data.points);
      }
    } catch (const std::exception &e) {
      record_failure("time_clustering", subject_id, e.what());
      result.success = false;
      result.error_message = e.what();
    }
    result.processing_time_ms = timer.elapsed_ms();
    return result;
  });
}

HealthStatus AnalyticsService::health_status() const {
  HealthStatus status;
  status.component = "analytics_service";
  bool cache_ok = cache_->is_healthy();
  status.healthy = cache_ok;
  status.details["cache"] = cache_ok ? "up" : "down";
  status.details["data_source"] = series_->source_label();
  status.details["workers"] = std::to_string(pool_->size());
  return status;
}

} // namespace analysis
