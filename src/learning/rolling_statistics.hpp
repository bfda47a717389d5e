#ifndef ROLLING_STATISTICS_HPP
#define ROLLING_STATISTICS_HPP

#include <cstddef>
#include <shared_mutex>

namespace learning {

/**
 * Thread-safe Exponentially Weighted Moving Average of a value stream.
 * Tracks an EWMA level and an EWMA variance of the one-step deviations.
 */
class RollingStatistics {
public:
  /**
   * Constructor
   * @param alpha Decay factor for EWMA (0 < alpha <= 1, larger = more reactive)
   */
  explicit RollingStatistics(double alpha = 0.3);

  void add_value(double value);

  /**
   * Current EWMA level
   */
  double get_mean() const;

  double get_variance() const;
  double get_standard_deviation() const;
  size_t get_sample_count() const;

  /**
   * Check if enough samples have been folded in for a usable level
   */
  bool is_established(size_t min_samples) const;

  void reset();

private:
  mutable std::shared_mutex mutex_;
  double alpha_;
  double ewma_mean_ = 0.0;
  double ewma_variance_ = 0.0;
  size_t sample_count_ = 0;
};

} // namespace learning

#endif // ROLLING_STATISTICS_HPP
