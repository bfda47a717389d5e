#include "hourly_profile.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace learning {

void HourlyProfile::add_observation(double value, uint64_t timestamp_ms) {
  int hour = Utils::hour_of_day_utc(timestamp_ms);
  sums_[hour] += value;
  counts_[hour]++;
  total_sum_ += value;
  total_count_++;
}

size_t HourlyProfile::hours_covered() const {
  return static_cast<size_t>(
      std::count_if(counts_.begin(), counts_.end(),
                    [](size_t count) { return count > 0; }));
}

bool HourlyProfile::has_hour(int hour) const {
  return hour >= 0 && hour < 24 && counts_[hour] > 0;
}

double HourlyProfile::overall_mean() const {
  return total_count_ > 0 ? total_sum_ / total_count_ : 0.0;
}

double HourlyProfile::hour_mean(int hour) const {
  if (!has_hour(hour))
    return overall_mean();
  return sums_[hour] / counts_[hour];
}

double HourlyProfile::expected_value(uint64_t timestamp_ms) const {
  return hour_mean(Utils::hour_of_day_utc(timestamp_ms));
}

double HourlyProfile::seasonal_offset(uint64_t timestamp_ms) const {
  int hour = Utils::hour_of_day_utc(timestamp_ms);
  if (!has_hour(hour))
    return 0.0;
  return hour_mean(hour) - overall_mean();
}

int HourlyProfile::peak_hour() const {
  int peak = -1;
  double best = 0.0;
  for (int hour = 0; hour < 24; ++hour) {
    if (!has_hour(hour))
      continue;
    double m = hour_mean(hour);
    if (peak < 0 || m > best) {
      best = m;
      peak = hour;
    }
  }
  return peak;
}

double HourlyProfile::peak_strength() const {
  int peak = peak_hour();
  if (peak < 0)
    return 0.0;

  double low = hour_mean(peak);
  double high = low;
  double sum = 0.0;
  size_t seen = 0;
  for (int hour = 0; hour < 24; ++hour) {
    if (!has_hour(hour))
      continue;
    double m = hour_mean(hour);
    low = std::min(low, m);
    high = std::max(high, m);
    sum += m;
    seen++;
  }
  if (high <= low)
    return 0.0;
  double typical = sum / seen;
  return std::clamp((high - typical) / (high - low), 0.0, 1.0);
}

const char *time_of_day_bucket(int hour) {
  if (hour < 0)
    return "unknown";
  if (hour < 6)
    return "night";
  if (hour < 12)
    return "morning";
  if (hour < 18)
    return "afternoon";
  return "evening";
}

} // namespace learning
