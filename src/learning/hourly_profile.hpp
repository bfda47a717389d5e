#ifndef HOURLY_PROFILE_HPP
#define HOURLY_PROFILE_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace learning {

/**
 * Hour-of-day profile of a value stream (24 UTC buckets).
 * Used as the seasonal baseline for anomaly residuals and as the seasonal
 * offset added to level forecasts.
 */
class HourlyProfile {
public:
  void add_observation(double value, uint64_t timestamp_ms);

  size_t observation_count() const { return total_count_; }
  size_t hours_covered() const;
  bool has_hour(int hour) const;

  double overall_mean() const;

  /**
   * Mean of the given hour, or the overall mean when that hour is unseen
   */
  double hour_mean(int hour) const;

  double expected_value(uint64_t timestamp_ms) const;

  /**
   * Deviation of the hour's mean from the overall mean, 0 for unseen hours
   */
  double seasonal_offset(uint64_t timestamp_ms) const;

  // Hour with the highest mean, earliest on ties; -1 when empty
  int peak_hour() const;

  // Where the peak sits between the quietest and busiest hour means, in
  // [0, 1]; 0 for a flat profile
  double peak_strength() const;

private:
  std::array<double, 24> sums_{};
  std::array<size_t, 24> counts_{};
  double total_sum_ = 0.0;
  size_t total_count_ = 0;
};

// night 0-5, morning 6-11, afternoon 12-17, evening 18-23
const char *time_of_day_bucket(int hour);

} // namespace learning

#endif // HOURLY_PROFILE_HPP
