#include "pattern_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "learning/hourly_profile.hpp"
#include "learning/rolling_statistics.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace analysis {

namespace {
constexpr uint64_t HOUR_MS = 3600ULL * 1000;
constexpr size_t TREND_WINDOW = 20;
constexpr double PREDICTION_DECAY = 0.9;
constexpr const char *MODEL_LABEL = "hourly_profile_v1";

learning::HourlyProfile
profile_of(const std::vector<TimeSeriesPoint> &points) {
  learning::HourlyProfile profile;
  for (const auto &p : points)
    profile.add_observation(p.value, p.timestamp_ms);
  return profile;
}

std::string hour_label(int hour) {
  std::ostringstream oss;
  oss << std::setw(2) << std::setfill('0') << hour << ":00";
  return oss.str();
}

double mean_confidence(const PatternAnalysisResult &result) {
  double sum = 0.0;
  size_t count = 0;
  for (const auto &p : result.behavioral_patterns) {
    sum += p.confidence;
    count++;
  }
  for (const auto &p : result.interval_patterns) {
    sum += p.confidence;
    count++;
  }
  return count > 0 ? sum / count : 0.0;
}
} // namespace

PatternEngine::PatternEngine(std::shared_ptr<SeriesProvider> series,
                             std::shared_ptr<cache::ResultCache> cache,
                             std::shared_ptr<WorkerPool> pool,
                             std::shared_ptr<const Config::AppConfig> config,
                             Clock clock)
    : series_(std::move(series)), cache_(std::move(cache)),
      pool_(std::move(pool)), config_(std::move(config)),
      statistics_(config_ ? config_->statistics : Config::StatisticsConfig{}),
      clock_(std::move(clock)) {
  if (!series_ || !cache_ || !pool_ || !config_)
    throw std::invalid_argument(
        "PatternEngine requires a series provider, cache, pool and config");
  if (config_->patterns.min_samples == 0)
    throw std::invalid_argument("Pattern min_samples must be greater than 0");
  if (!clock_)
    clock_ = [] { return Utils::get_current_time_ms(); };
}

// --- Async entry points ---

std::future<PatternAnalysisResult>
PatternEngine::analyze_device_patterns(const std::string &device_id,
                                       const std::vector<std::string> &intervals) {
  return pool_->submit([this, device_id, intervals] {
    return compute_device_patterns(device_id, intervals);
  });
}

std::future<PatternAnalysisResult> PatternEngine::analyze_household_patterns(
    const std::string &household_id, const std::vector<std::string> &intervals) {
  return pool_->submit([this, household_id, intervals] {
    return compute_household_patterns(household_id, intervals);
  });
}

std::future<BehavioralModelResult>
PatternEngine::build_behavioral_model(const std::string &household_id) {
  return pool_->submit(
      [this, household_id] { return compute_behavioral_model(household_id); });
}

std::future<PatternAnalysisResult>
PatternEngine::detect_anomalies(const std::string &subject_id) {
  return pool_->submit(
      [this, subject_id] { return compute_anomalies(subject_id); });
}

std::future<PatternAnalysisResult>
PatternEngine::generate_predictions(const std::string &subject_id) {
  return pool_->submit(
      [this, subject_id] { return compute_predictions(subject_id); });
}

// --- Cached synchronous forms ---

PatternAnalysisResult
PatternEngine::compute_device_patterns(const std::string &device_id,
                                       const std::vector<std::string> &intervals) {
  return cache_->get_or_compute<PatternAnalysisResult>(
      cache::CacheOperation::PATTERN,
      cache::CacheKeys::device_pattern(device_id, intervals),
      [&] { return device_patterns_uncached(device_id, intervals); });
}

PatternAnalysisResult PatternEngine::compute_household_patterns(
    const std::string &household_id, const std::vector<std::string> &intervals) {
  return cache_->get_or_compute<PatternAnalysisResult>(
      cache::CacheOperation::PATTERN,
      cache::CacheKeys::household_pattern(household_id, intervals),
      [&] { return household_patterns_uncached(household_id, intervals); });
}

BehavioralModelResult
PatternEngine::compute_behavioral_model(const std::string &household_id) {
  return cache_->get_or_compute<BehavioralModelResult>(
      cache::CacheOperation::PATTERN,
      cache::CacheKeys::behavioral_model(household_id),
      [&] { return behavioral_model_uncached(household_id); });
}

PatternAnalysisResult
PatternEngine::compute_anomalies(const std::string &subject_id) {
  return cache_->get_or_compute<PatternAnalysisResult>(
      cache::CacheOperation::ANOMALY, cache::CacheKeys::anomaly(subject_id),
      [&] { return anomalies_uncached(subject_id); });
}

PatternAnalysisResult
PatternEngine::compute_predictions(const std::string &subject_id) {
  return cache_->get_or_compute<PatternAnalysisResult>(
      cache::CacheOperation::PREDICTION,
      cache::CacheKeys::prediction(subject_id),
      [&] { return predictions_uncached(subject_id); });
}

// --- Shared helpers ---

TimeRange PatternEngine::lookback_range() const {
  uint64_t end = clock_();
  uint64_t span =
      static_cast<uint64_t>(config_->default_lookback_hours) * HOUR_MS;
  return TimeRange{end > span ? end - span : 0, end};
}

TimeSeriesData PatternEngine::load_hourly(const std::string &subject_id) {
  return series_->load(subject_id, lookback_range(), Granularity::HOURLY);
}

PatternAnalysisResult
PatternEngine::new_result(const std::string &subject_id) const {
  PatternAnalysisResult result;
  result.subject_id = subject_id;
  result.analyzed_at_ms = Utils::get_current_time_ms();
  result.model_label = MODEL_LABEL;
  result.privacy_level = config_->patterns.privacy_level;
  return result;
}

void PatternEngine::fail(PatternAnalysisResult &result, const char *operation,
                         const std::string &message) const {
  LOG(LogLevel::ERROR, LogComponent::ANALYSIS_PATTERN,
      operation << " failed for " << result.subject_id << ": " << message);
  MetricsRegistry::instance().operation_failure(operation).Increment();
  result.success = false;
  result.error_message = message;
  result.confidence = 0.0;
  result.interval_patterns.clear();
  result.behavioral_patterns.clear();
  result.anomalies.clear();
  result.predictions.clear();
}

double PatternEngine::sufficiency(size_t samples) const {
  return std::min(1.0, static_cast<double>(samples) /
                           static_cast<double>(config_->patterns.min_samples));
}

std::vector<TimeIntervalPattern>
PatternEngine::interval_patterns(const std::vector<TimeSeriesPoint> &points,
                                 const std::vector<std::string> &intervals,
                                 uint64_t window_end_ms) const {
  std::vector<TimeIntervalPattern> patterns;
  if (points.empty())
    return patterns;

  double overall = 0.0;
  for (const auto &p : points)
    overall += p.value;
  overall /= points.size();

  for (const auto &label : intervals) {
    auto duration = Utils::parse_duration_ms(label);
    if (!duration || *duration == 0) {
      LOG(LogLevel::WARN, LogComponent::ANALYSIS_PATTERN,
          "Ignoring unparseable interval '" << label << "'");
      continue;
    }
    uint64_t start = window_end_ms > *duration ? window_end_ms - *duration : 0;

    TimeIntervalPattern pattern;
    pattern.interval = label;
    double sum = 0.0;
    for (const auto &p : points) {
      if (p.timestamp_ms >= start && p.timestamp_ms <= window_end_ms) {
        sum += p.value;
        pattern.sample_count++;
      }
    }
    if (pattern.sample_count > 0)
      pattern.mean_value = sum / pattern.sample_count;
    pattern.relative_to_overall =
        overall != 0.0 ? pattern.mean_value / overall : 0.0;

    double expected = std::max(1.0, static_cast<double>(*duration) / HOUR_MS);
    pattern.coverage = std::min(1.0, pattern.sample_count / expected);
    pattern.confidence = pattern.coverage;
    patterns.push_back(std::move(pattern));
  }
  return patterns;
}

// --- Device patterns ---

PatternAnalysisResult
PatternEngine::device_patterns_uncached(const std::string &device_id,
                                        const std::vector<std::string> &intervals) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("device_patterns"));
  auto result = new_result(device_id);

  try {
    auto data = load_hourly(device_id);
    if (!data.success) {
      fail(result, "device_patterns", data.error_message);
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }
    const auto &points = data.points;
    if (points.empty()) {
      LOG(LogLevel::INFO, LogComponent::ANALYSIS_PATTERN,
          "No data in lookback window for device " << device_id);
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }

    auto profile = profile_of(points);
    int peak = profile.peak_hour();
    if (peak >= 0) {
      BehavioralPattern pattern;
      pattern.pattern_type = "peak_usage";
      pattern.peak_hour = peak;
      pattern.time_of_day = learning::time_of_day_bucket(peak);
      pattern.strength = profile.peak_strength();
      pattern.confidence = profile.hours_covered() / 24.0;
      pattern.description = "Peak usage around " + hour_label(peak) + " (" +
                            pattern.time_of_day + ")";
      result.behavioral_patterns.push_back(std::move(pattern));
    }

    auto seasonality = statistics_.detect_seasonality(data.values());
    if (seasonality.has_seasonality) {
      BehavioralPattern pattern;
      pattern.pattern_type = "daily_routine";
      pattern.peak_hour = peak;
      pattern.time_of_day = learning::time_of_day_bucket(peak);
      pattern.strength = seasonality.strength;
      pattern.confidence = std::min(1.0, seasonality.strength);
      pattern.description = "Repeats on a " +
                            std::to_string(seasonality.period) +
                            "-hour cycle";
      result.behavioral_patterns.push_back(std::move(pattern));
    }

    if (points.size() >= TREND_WINDOW) {
      auto ma = statistics_.moving_average(points, TREND_WINDOW);
      size_t half = ma.values.size() / 2;
      double first = 0.0, second = 0.0;
      for (size_t i = 0; i < ma.values.size(); ++i)
        (i < half ? first : second) += ma.values[i].value;
      first = half > 0 ? first / half : 0.0;
      second = ma.values.size() > half ? second / (ma.values.size() - half)
                                       : 0.0;
      double base = std::abs(first) > 1e-9 ? std::abs(first) : 1.0;
      double change = (second - first) / base;

      BehavioralPattern pattern;
      pattern.pattern_type = "usage_trend";
      pattern.strength = std::min(1.0, std::abs(change));
      pattern.confidence =
          std::min(1.0, ma.values.size() / (2.0 * TREND_WINDOW));
      std::ostringstream desc;
      desc << "Usage trending " << ma.trend_direction << " ("
           << std::showpos << std::fixed << std::setprecision(1)
           << change * 100.0 << "% between halves)";
      pattern.description = desc.str();
      result.behavioral_patterns.push_back(std::move(pattern));
    }

    result.interval_patterns =
        interval_patterns(points, intervals, data.range.end_ms);
    result.confidence = sufficiency(points.size()) * mean_confidence(result);
  } catch (const std::exception &e) {
    fail(result, "device_patterns", e.what());
  }

  result.processing_time_ms = timer.elapsed_ms();
  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_PATTERN,
      "Device patterns for " << device_id << ": "
                             << result.behavioral_patterns.size()
                             << " behavioural, "
                             << result.interval_patterns.size()
                             << " interval, confidence " << result.confidence);
  return result;
}

// --- Household ---

BehavioralModelResult
PatternEngine::behavioral_model_uncached(const std::string &household_id) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("behavioral_model"));
  BehavioralModelResult model;
  model.household_id = household_id;
  model.analyzed_at_ms = Utils::get_current_time_ms();

  try {
    auto devices = series_->devices_in_household(household_id);
    if (devices.empty()) {
      LOG(LogLevel::INFO, LogComponent::ANALYSIS_PATTERN,
          "Household " << household_id << " has no registered devices");
      model.processing_time_ms = timer.elapsed_ms();
      return model;
    }

    std::map<int, std::vector<std::string>> by_peak_hour;
    std::array<double, 24> household_hourly{};
    std::array<bool, 24> hour_seen{};
    double sufficiency_sum = 0.0;
    double average_sum = 0.0;

    for (const auto &device : devices) {
      auto data = load_hourly(device);
      if (!data.success) {
        LOG(LogLevel::WARN, LogComponent::ANALYSIS_PATTERN,
            "Skipping device " << device << " in household " << household_id
                               << ": " << data.error_message);
        continue;
      }
      if (data.points.empty())
        continue;

      auto profile = profile_of(data.points);
      DeviceUsagePattern usage;
      usage.device_id = device;
      usage.peak_hour = profile.peak_hour();
      usage.average_value = profile.overall_mean();
      if (data.points.size() >= TREND_WINDOW)
        usage.trend_direction =
            statistics_.moving_average(data.points, TREND_WINDOW)
                .trend_direction;
      model.device_usage.push_back(usage);

      by_peak_hour[usage.peak_hour].push_back(device);
      for (int hour = 0; hour < 24; ++hour) {
        if (!profile.has_hour(hour))
          continue;
        household_hourly[hour] += profile.hour_mean(hour);
        hour_seen[hour] = true;
      }
      sufficiency_sum += sufficiency(data.points.size());
      average_sum += usage.average_value;
    }

    const size_t active = model.device_usage.size();
    if (active == 0) {
      model.processing_time_ms = timer.elapsed_ms();
      return model;
    }

    for (auto &usage : model.device_usage)
      usage.share_of_household =
          average_sum != 0.0 ? usage.average_value / average_sum : 0.0;

    for (const auto &[hour, members] : by_peak_hour) {
      if (members.size() < 2)
        continue;
      HouseholdRoutine routine;
      routine.hour = hour;
      routine.time_of_day = learning::time_of_day_bucket(hour);
      routine.devices = members;
      routine.confidence = static_cast<double>(members.size()) / active;
      routine.description = std::to_string(members.size()) +
                            " devices peak together around " +
                            hour_label(hour);
      model.routines.push_back(std::move(routine));
    }

    std::vector<int> hours;
    for (int hour = 0; hour < 24; ++hour) {
      if (hour_seen[hour])
        hours.push_back(hour);
    }
    if (!hours.empty()) {
      std::stable_sort(hours.begin(), hours.end(), [&](int a, int b) {
        return household_hourly[a] > household_hourly[b];
      });

      EnergyPattern peak;
      peak.pattern_type = "peak_hours";
      size_t top = std::min<size_t>(3, hours.size());
      double sum = 0.0;
      for (size_t i = 0; i < top; ++i) {
        peak.hours.push_back(hours[i]);
        sum += household_hourly[hours[i]];
      }
      peak.value = sum / top;
      peak.description = "Highest combined load around " +
                         hour_label(peak.hours.front());
      model.energy_patterns.push_back(std::move(peak));

      EnergyPattern base;
      base.pattern_type = "base_load";
      base.hours.push_back(hours.back());
      base.value = household_hourly[hours.back()];
      base.description = "Lowest combined load around " +
                         hour_label(hours.back());
      model.energy_patterns.push_back(std::move(base));
    }

    model.confidence = (sufficiency_sum / active) *
                       (static_cast<double>(active) / devices.size());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ANALYSIS_PATTERN,
        "Behavioural model failed for " << household_id << ": " << e.what());
    MetricsRegistry::instance().operation_failure("behavioral_model").Increment();
    model.success = false;
    model.error_message = e.what();
    model.confidence = 0.0;
    model.routines.clear();
    model.device_usage.clear();
    model.energy_patterns.clear();
  }

  model.processing_time_ms = timer.elapsed_ms();
  return model;
}

PatternAnalysisResult PatternEngine::household_patterns_uncached(
    const std::string &household_id, const std::vector<std::string> &intervals) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("household_patterns"));
  auto result = new_result(household_id);

  try {
    auto model = compute_behavioral_model(household_id);
    if (!model.success) {
      fail(result, "household_patterns", model.error_message);
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }
    if (model.device_usage.empty()) {
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }

    for (const auto &routine : model.routines) {
      BehavioralPattern pattern;
      pattern.pattern_type = "household_routine";
      pattern.peak_hour = routine.hour;
      pattern.time_of_day = routine.time_of_day;
      pattern.strength = routine.confidence;
      pattern.confidence = routine.confidence;
      pattern.description = routine.description;
      result.behavioral_patterns.push_back(std::move(pattern));
    }
    for (const auto &usage : model.device_usage) {
      BehavioralPattern pattern;
      pattern.pattern_type = "device_usage";
      pattern.peak_hour = usage.peak_hour;
      pattern.time_of_day = learning::time_of_day_bucket(usage.peak_hour);
      pattern.strength = usage.share_of_household;
      pattern.confidence = model.confidence;
      pattern.description = usage.device_id + " peaks around " +
                            hour_label(usage.peak_hour) + ", trend " +
                            usage.trend_direction;
      result.behavioral_patterns.push_back(std::move(pattern));
    }

    if (!intervals.empty()) {
      // Combined household load, summed per timestamp
      std::map<uint64_t, double> combined;
      TimeRange range = lookback_range();
      for (const auto &usage : model.device_usage) {
        auto data = load_hourly(usage.device_id);
        range = data.range;
        for (const auto &p : data.points)
          combined[p.timestamp_ms] += p.value;
      }
      std::vector<TimeSeriesPoint> points;
      points.reserve(combined.size());
      for (const auto &[ts, value] : combined)
        points.push_back(TimeSeriesPoint{ts, value, "household_total", ""});
      result.interval_patterns =
          interval_patterns(points, intervals, range.end_ms);
    }

    result.confidence = model.confidence * mean_confidence(result);
  } catch (const std::exception &e) {
    fail(result, "household_patterns", e.what());
  }

  result.processing_time_ms = timer.elapsed_ms();
  return result;
}

// --- Anomalies ---

PatternAnalysisResult
PatternEngine::anomalies_uncached(const std::string &subject_id) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("anomalies"));
  auto result = new_result(subject_id);

  try {
    auto data = load_hourly(subject_id);
    if (!data.success) {
      fail(result, "anomalies", data.error_message);
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }
    const auto &points = data.points;
    if (points.empty()) {
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }

    auto profile = profile_of(points);
    // The hourly baseline needs two full days to mean anything
    bool use_profile =
        points.back().timestamp_ms - points.front().timestamp_ms >= 48 * HOUR_MS;

    std::vector<double> baseline(points.size());
    std::vector<double> residuals(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
      baseline[i] = use_profile ? profile.expected_value(points[i].timestamp_ms)
                                : profile.overall_mean();
      residuals[i] = points[i].value - baseline[i];
    }

    double mean_r = stats::mean(residuals);
    double std_r = std::sqrt(stats::sample_variance(residuals));
    const double threshold = config_->patterns.anomaly_z_threshold;

    if (std_r > 1e-12) {
      for (size_t i = 0; i < points.size(); ++i) {
        double z = (residuals[i] - mean_r) / std_r;
        if (std::abs(z) <= threshold)
          continue;
        Anomaly anomaly;
        anomaly.timestamp_ms = points[i].timestamp_ms;
        anomaly.value = points[i].value;
        anomaly.expected_value = baseline[i] + mean_r;
        anomaly.z_score = z;
        anomaly.anomaly_type = z > 0 ? "spike" : "drop";
        anomaly.severity = std::min(1.0, std::abs(z) / (2.0 * threshold));
        std::ostringstream desc;
        desc << std::fixed << std::setprecision(2) << "Value "
             << anomaly.value << " is " << std::abs(z)
             << " standard deviations " << (z > 0 ? "above" : "below")
             << (use_profile ? " the hourly baseline" : " the mean")
             << " at " << Utils::format_iso8601_ms(anomaly.timestamp_ms);
        anomaly.description = desc.str();
        result.anomalies.push_back(std::move(anomaly));
      }
    }
    result.confidence = sufficiency(points.size());

    if (!result.anomalies.empty()) {
      LOG(LogLevel::INFO, LogComponent::ANALYSIS_PATTERN,
          "Detected " << result.anomalies.size() << " anomalies for "
                      << subject_id);
    }
  } catch (const std::exception &e) {
    fail(result, "anomalies", e.what());
  }

  result.processing_time_ms = timer.elapsed_ms();
  return result;
}

// --- Predictions ---

PatternAnalysisResult
PatternEngine::predictions_uncached(const std::string &subject_id) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("predictions"));
  auto result = new_result(subject_id);

  try {
    auto data = load_hourly(subject_id);
    if (!data.success) {
      fail(result, "predictions", data.error_message);
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }
    const auto &points = data.points;
    if (points.empty()) {
      result.processing_time_ms = timer.elapsed_ms();
      return result;
    }

    auto profile = profile_of(points);
    learning::RollingStatistics level(config_->patterns.ewma_alpha);
    for (const auto &p : points)
      level.add_value(p.value - profile.seasonal_offset(p.timestamp_ms));

    const double base_confidence = sufficiency(points.size());
    const double spread = level.get_standard_deviation();
    const uint64_t last_ts = points.back().timestamp_ms;

    double step_confidence = base_confidence;
    for (size_t step = 1; step <= config_->patterns.prediction_horizon_steps;
         ++step) {
      Prediction prediction;
      prediction.step = step;
      prediction.timestamp_ms = last_ts + step * HOUR_MS;
      prediction.predicted_value =
          level.get_mean() + profile.seasonal_offset(prediction.timestamp_ms);
      double margin = 1.96 * spread * std::sqrt(static_cast<double>(step));
      prediction.lower_bound = prediction.predicted_value - margin;
      prediction.upper_bound = prediction.predicted_value + margin;
      prediction.confidence = step_confidence;
      result.predictions.push_back(prediction);
      step_confidence *= PREDICTION_DECAY;
    }
    result.confidence = base_confidence;
  } catch (const std::exception &e) {
    fail(result, "predictions", e.what());
  }

  result.processing_time_ms = timer.elapsed_ms();
  return result;
}

// --- Cache management and health ---

void PatternEngine::clear_device_cache(const std::string &device_id) {
  cache_->invalidate_prefix("pattern:device:" + device_id + ":");
  cache_->invalidate_prefix("timeseries:" + device_id + ":");
  cache_->invalidate_prefix("statistical:" + device_id + ":");
  cache_->invalidate_prefix("frequency:" + device_id + ":");
  cache_->invalidate(cache::CacheKeys::anomaly(device_id));
  cache_->invalidate(cache::CacheKeys::prediction(device_id));
  LOG(LogLevel::INFO, LogComponent::ANALYSIS_PATTERN,
      "Cleared cached analyses for device " << device_id);
}

void PatternEngine::clear_household_cache(const std::string &household_id) {
  cache_->invalidate_prefix("pattern:household:" + household_id + ":");
  try {
    for (const auto &device : series_->devices_in_household(household_id))
      clear_device_cache(device);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::ANALYSIS_PATTERN,
        "Could not list devices of " << household_id
                                     << " for invalidation: " << e.what());
  }
  LOG(LogLevel::INFO, LogComponent::ANALYSIS_PATTERN,
      "Cleared cached analyses for household " << household_id);
}

HealthStatus PatternEngine::health_status() const {
  HealthStatus status;
  status.component = "pattern_engine";
  bool cache_ok = cache_->is_healthy();
  status.healthy = cache_ok;
  status.details["cache"] = cache_ok ? "up" : "down";
  status.details["workers"] = std::to_string(pool_->size());
  status.details["model"] = MODEL_LABEL;
  status.details["privacy_level"] = config_->patterns.privacy_level;
  return status;
}

} // namespace analysis
