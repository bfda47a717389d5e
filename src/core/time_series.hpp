#ifndef TIME_SERIES_HPP
#define TIME_SERIES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Granularity { FIFTEEN_MINUTES, HOURLY, DAILY };

std::optional<Granularity> parse_granularity(std::string_view label);
const char *granularity_to_string(Granularity granularity);
uint64_t granularity_to_ms(Granularity granularity);

struct TimeRange {
  uint64_t start_ms = 0;
  uint64_t end_ms = 0;

  bool contains(uint64_t timestamp_ms) const {
    return timestamp_ms >= start_ms && timestamp_ms <= end_ms;
  }
  std::string to_key() const;
};

struct TimeSeriesPoint {
  uint64_t timestamp_ms = 0;
  double value = 0.0;
  std::string metric;
  std::string unit;
};

struct TimeSeriesData {
  std::string subject_id;
  TimeRange range;
  Granularity granularity = Granularity::HOURLY;
  std::vector<TimeSeriesPoint> points;
  // mean, median, std_dev, min, max, total
  std::map<std::string, double> aggregated_metrics;
  uint64_t analyzed_at_ms = 0;
  bool success = true;
  std::string error_message;
  std::string data_source;
  uint64_t processing_time_ms = 0;
  size_t total_points = 0;

  std::vector<double> values() const;
};

#endif // TIME_SERIES_HPP
