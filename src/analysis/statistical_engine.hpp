#ifndef STATISTICAL_ENGINE_HPP
#define STATISTICAL_ENGINE_HPP

#include "analysis_types.hpp"
#include "core/config.hpp"

#include <string>
#include <vector>

namespace analysis {

// Descriptive helpers shared by the engines. All return 0 for empty input.
namespace stats {
double mean(const std::vector<double> &values);
double median(std::vector<double> values);
// n-1 denominator; 0 when fewer than two samples
double sample_variance(const std::vector<double> &values);
double population_variance(const std::vector<double> &values);
// sum((x_i - mu)(x_{i+lag} - mu)) / ((n - lag) * var_pop)
double autocorrelation(const std::vector<double> &values, size_t lag);
// Compares the mean of the second half to the first half
std::string trend_direction(const std::vector<double> &values);
} // namespace stats

/**
 * Stateless statistical analysis over one subject's ordered points:
 * descriptive statistics, moving averages, lag autocorrelation seasonality
 * and equal-width value clustering.
 */
class StatisticalEngine {
public:
  explicit StatisticalEngine(Config::StatisticsConfig config);

  StatisticalAnalysisResult
  analyze(const std::string &subject_id,
          const std::vector<TimeSeriesPoint> &points) const;

  /**
   * Moving average with window w: entry i (i >= w-1) averages samples
   * [i-w+1, i] and carries the timestamp of sample i.
   * @return Empty list when w exceeds the input length or is 0
   */
  MovingAverage moving_average(const std::vector<TimeSeriesPoint> &points,
                               size_t window) const;

  SeasonalityInfo detect_seasonality(const std::vector<double> &values) const;

  // k equal-width buckets; each point joins its nearest centroid
  std::vector<TimeCluster>
  cluster(const std::vector<TimeSeriesPoint> &points) const;

  const Config::StatisticsConfig &config() const { return config_; }

private:
  Config::StatisticsConfig config_;
};

} // namespace analysis

#endif // STATISTICAL_ENGINE_HPP
