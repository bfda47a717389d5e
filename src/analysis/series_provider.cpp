#include "series_provider.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "statistical_engine.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace analysis {

SeriesProvider::SeriesProvider(
    std::shared_ptr<ingest::ITimeSeriesSource> source,
    std::shared_ptr<cache::ResultCache> cache)
    : source_(std::move(source)), cache_(std::move(cache)) {
  if (!source_ || !cache_)
    throw std::invalid_argument("SeriesProvider requires a source and a cache");
}

TimeSeriesData SeriesProvider::load(const std::string &subject_id,
                                    const TimeRange &range,
                                    Granularity granularity) {
  auto key = cache::CacheKeys::time_series(subject_id, range.to_key(),
                                           granularity_to_string(granularity));
  return cache_->get_or_compute<TimeSeriesData>(
      cache::CacheOperation::TIME_SERIES, key,
      [&] { return fetch_uncached(subject_id, range, granularity); });
}

TimeSeriesData SeriesProvider::fetch_uncached(const std::string &subject_id,
                                              const TimeRange &range,
                                              Granularity granularity) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("time_series"));

  TimeSeriesData data;
  data.subject_id = subject_id;
  data.range = range;
  data.granularity = granularity;
  data.data_source = source_->source_label();
  data.analyzed_at_ms = Utils::get_current_time_ms();

  try {
    data.points = source_->fetch(subject_id, range.start_ms, range.end_ms,
                                 granularity);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::INGEST,
        "Time series fetch failed for " << subject_id << ": " << e.what());
    MetricsRegistry::instance().operation_failure("time_series").Increment();
    data.points.clear();
    data.success = false;
    data.error_message = std::string("time series fetch failed: ") + e.what();
    data.processing_time_ms = timer.elapsed_ms();
    return data;
  }

  data.total_points = data.points.size();
  auto values = data.values();
  if (!values.empty()) {
    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    data.aggregated_metrics["mean"] = stats::mean(values);
    data.aggregated_metrics["median"] = stats::median(values);
    data.aggregated_metrics["std_dev"] =
        std::sqrt(stats::sample_variance(values));
    data.aggregated_metrics["min"] = *min_it;
    data.aggregated_metrics["max"] = *max_it;
    data.aggregated_metrics["total"] =
        std::accumulate(values.begin(), values.end(), 0.0);
  }
  data.processing_time_ms = timer.elapsed_ms();

  LOG(LogLevel::DEBUG, LogComponent::INGEST,
      "Fetched " << data.total_points << " points for " << subject_id << " ["
                 << range.start_ms << ", " << range.end_ms << "] at "
                 << granularity_to_string(granularity));
  return data;
}

std::vector<std::string>
SeriesProvider::devices_in_household(const std::string &household_id) {
  return source_->devices_in_household(household_id);
}

std::string SeriesProvider::source_label() const {
  return source_->source_label();
}

} // namespace analysis
