#include "statistical_engine.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace analysis {

namespace stats {

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double median(std::vector<double> values) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());
  size_t mid = values.size() / 2;
  if (values.size() % 2 == 0)
    return (values[mid - 1] + values[mid]) / 2.0;
  return values[mid];
}

double sample_variance(const std::vector<double> &values) {
  if (values.size() < 2)
    return 0.0;
  double mu = mean(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - mu) * (v - mu);
  return sum_sq / (values.size() - 1);
}

double population_variance(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  double mu = mean(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - mu) * (v - mu);
  return sum_sq / values.size();
}

double autocorrelation(const std::vector<double> &values, size_t lag) {
  const size_t n = values.size();
  if (lag == 0 || n < 2 * lag)
    return 0.0;
  double variance = population_variance(values);
  if (variance <= 0.0)
    return 0.0;

  double mu = mean(values);
  double sum = 0.0;
  for (size_t i = 0; i + lag < n; ++i)
    sum += (values[i] - mu) * (values[i + lag] - mu);
  return sum / ((n - lag) * variance);
}

std::string trend_direction(const std::vector<double> &values) {
  if (values.size() < 2)
    return "flat";
  size_t half = values.size() / 2;
  double first = mean(std::vector<double>(values.begin(), values.begin() + half));
  double second = mean(std::vector<double>(values.begin() + half, values.end()));
  if (second > first)
    return "up";
  if (second < first)
    return "down";
  return "flat";
}

} // namespace stats

StatisticalEngine::StatisticalEngine(Config::StatisticsConfig config)
    : config_(std::move(config)) {
  if (config_.cluster_count == 0)
    throw std::invalid_argument("Cluster count must be greater than 0");
  if (config_.seasonality_lag == 0)
    throw std::invalid_argument("Seasonality lag must be greater than 0");
}

StatisticalAnalysisResult
StatisticalEngine::analyze(const std::string &subject_id,
                           const std::vector<TimeSeriesPoint> &points) const {
  StatisticalAnalysisResult result;
  result.subject_id = subject_id;
  result.model_label = "statistical_v1";
  result.analyzed_at_ms = Utils::get_current_time_ms();
  result.sample_count = points.size();

  if (points.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_STATS,
        "No samples for " << subject_id << ", returning zeroed statistics");
    return result;
  }

  std::vector<double> values;
  values.reserve(points.size());
  for (const auto &p : points)
    values.push_back(p.value);

  auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
  result.mean = stats::mean(values);
  result.median = stats::median(values);
  result.variance = stats::sample_variance(values);
  result.std_dev = std::sqrt(result.variance);
  result.min = *min_it;
  result.max = *max_it;
  result.range = result.max - result.min;

  for (size_t window : config_.moving_average_windows) {
    if (window == 0 || window > points.size())
      continue;
    result.moving_averages.push_back(moving_average(points, window));
  }

  result.seasonality = detect_seasonality(values);
  result.clusters = cluster(points);

  // Full confidence once two seasonal periods are covered
  double sufficiency = std::min(
      1.0, static_cast<double>(values.size()) / (2.0 * config_.seasonality_lag));
  result.confidence = 0.88 * sufficiency;

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_STATS,
      "Statistics for " << subject_id << ": n=" << values.size()
                        << " mean=" << result.mean
                        << " std_dev=" << result.std_dev);
  return result;
}

MovingAverage
StatisticalEngine::moving_average(const std::vector<TimeSeriesPoint> &points,
                                  size_t window) const {
  MovingAverage ma;
  ma.window_size = window;
  if (window == 0 || window > points.size())
    return ma;

  double sum = 0.0;
  for (size_t i = 0; i < points.size(); ++i) {
    sum += points[i].value;
    if (i >= window)
      sum -= points[i - window].value;
    if (i + 1 >= window)
      ma.values.push_back({points[i].timestamp_ms, sum / window});
  }

  std::vector<double> averaged;
  averaged.reserve(ma.values.size());
  for (const auto &v : ma.values)
    averaged.push_back(v.value);
  ma.average_value = stats::mean(averaged);
  ma.trend_direction = stats::trend_direction(averaged);
  return ma;
}

SeasonalityInfo
StatisticalEngine::detect_seasonality(const std::vector<double> &values) const {
  SeasonalityInfo info;
  info.coefficient = stats::autocorrelation(values, config_.seasonality_lag);
  info.has_seasonality = info.coefficient > config_.seasonality_threshold;
  info.seasonality_type = info.has_seasonality ? "daily" : "none";
  info.strength = std::abs(info.coefficient);
  info.period = config_.seasonality_lag;
  return info;
}

std::vector<TimeCluster>
StatisticalEngine::cluster(const std::vector<TimeSeriesPoint> &points) const {
  std::vector<TimeCluster> clusters;
  if (points.empty())
    return clusters;

  const size_t k = config_.cluster_count;
  auto [min_it, max_it] = std::minmax_element(
      points.begin(), points.end(),
      [](const TimeSeriesPoint &a, const TimeSeriesPoint &b) {
        return a.value < b.value;
      });
  const double min_value = min_it->value;
  const double range = max_it->value - min_value;

  clusters.resize(k);
  for (size_t i = 0; i < k; ++i) {
    clusters[i].cluster_id = i;
    clusters[i].label = "Cluster " + std::to_string(i + 1);
    clusters[i].centroid = min_value + range * (i + 0.5) / k;
  }

  for (const auto &point : points) {
    size_t nearest = 0;
    double best = std::abs(point.value - clusters[0].centroid);
    for (size_t i = 1; i < k; ++i) {
      double distance = std::abs(point.value - clusters[i].centroid);
      if (distance < best) {
        best = distance;
        nearest = i;
      }
    }
    clusters[nearest].members.push_back(point);
  }

  for (auto &c : clusters) {
    c.size = c.members.size();
    c.density = static_cast<double>(c.size) / points.size();
  }
  return clusters;
}

} // namespace analysis
