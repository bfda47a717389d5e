#include "time_series.hpp"

std::optional<Granularity> parse_granularity(std::string_view label) {
  if (label == "15m")
    return Granularity::FIFTEEN_MINUTES;
  if (label == "1h")
    return Granularity::HOURLY;
  if (label == "1d")
    return Granularity::DAILY;
  return std::nullopt;
}

const char *granularity_to_string(Granularity granularity) {
  switch (granularity) {
  case Granularity::FIFTEEN_MINUTES:
    return "15m";
  case Granularity::HOURLY:
    return "1h";
  case Granularity::DAILY:
    return "1d";
  }
  return "1h";
}

uint64_t granularity_to_ms(Granularity granularity) {
  switch (granularity) {
  case Granularity::FIFTEEN_MINUTES:
    return 15ULL * 60 * 1000;
  case Granularity::HOURLY:
    return 3600ULL * 1000;
  case Granularity::DAILY:
    return 24ULL * 3600 * 1000;
  }
  return 3600ULL * 1000;
}

std::string TimeRange::to_key() const {
  return std::to_string(start_ms) + "-" + std::to_string(end_ms);
}

std::vector<double> TimeSeriesData::values() const {
  std::vector<double> out;
  out.reserve(points.size());
  for (const auto &point : points)
    out.push_back(point.value);
  return out;
}
