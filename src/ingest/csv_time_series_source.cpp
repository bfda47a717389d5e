#include "csv_time_series_source.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ingest {

std::vector<TimeSeriesPoint>
bucket_points(const std::vector<TimeSeriesPoint> &raw,
              Granularity granularity) {
  const uint64_t width = granularity_to_ms(granularity);

  struct Bucket {
    double sum = 0.0;
    size_t count = 0;
    std::string metric;
    std::string unit;
  };
  std::map<uint64_t, Bucket> buckets;
  for (const auto &point : raw) {
    auto &bucket = buckets[point.timestamp_ms - point.timestamp_ms % width];
    bucket.sum += point.value;
    if (bucket.count++ == 0) {
      bucket.metric = point.metric;
      bucket.unit = point.unit;
    }
  }

  std::vector<TimeSeriesPoint> out;
  out.reserve(buckets.size());
  for (const auto &[start, bucket] : buckets) {
    out.push_back(TimeSeriesPoint{start, bucket.sum / bucket.count,
                                  bucket.metric, bucket.unit});
  }
  return out;
}

CsvTimeSeriesSource::CsvTimeSeriesSource(const std::string &filepath,
                                         std::string label)
    : label_(std::move(label)) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::INGEST,
        "Failed to open time series file: " << filepath);
    throw std::runtime_error("Failed to open time series file: " + filepath);
  }

  std::string line;
  uint64_t line_number = 0;
  while (std::getline(file, line)) {
    line_number++;
    auto trimmed = Utils::trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;
    if (line_number == 1 && trimmed.rfind("subject_id", 0) == 0)
      continue;
    if (parse_line(trimmed, line_number))
      rows_loaded_++;
    else
      rows_rejected_++;
  }

  for (auto &[subject, points] : series_) {
    std::stable_sort(points.begin(), points.end(),
                     [](const TimeSeriesPoint &a, const TimeSeriesPoint &b) {
                       return a.timestamp_ms < b.timestamp_ms;
                     });
  }
  for (auto &[household, devices] : households_) {
    std::sort(devices.begin(), devices.end());
    devices.erase(std::unique(devices.begin(), devices.end()), devices.end());
  }

  LOG(LogLevel::INFO, LogComponent::INGEST,
      "Loaded " << rows_loaded_ << " rows for " << series_.size()
                << " subjects from " << filepath << " (" << rows_rejected_
                << " rejected)");
}

bool CsvTimeSeriesSource::parse_line(const std::string &line,
                                     uint64_t line_number) {
  auto fields = Utils::split_string(line, ',');
  if (fields.size() < 3) {
    LOG(LogLevel::WARN, LogComponent::INGEST,
        "Line " << line_number << ": expected at least 3 fields, got "
                << fields.size());
    return false;
  }
  for (auto &field : fields)
    field = Utils::trim_copy(field);

  const std::string &subject = fields[0];
  if (fields[1].empty() || fields[2].empty()) {
    LOG(LogLevel::WARN, LogComponent::INGEST,
        "Line " << line_number << ": empty timestamp or value");
    return false;
  }
  auto timestamp = Utils::string_to_number<uint64_t>(fields[1]);
  auto value = Utils::string_to_number<double>(fields[2]);
  if (subject.empty() || !timestamp || !value) {
    LOG(LogLevel::WARN, LogComponent::INGEST,
        "Line " << line_number << ": malformed subject, timestamp or value");
    return false;
  }
  if (!std::isfinite(*value)) {
    LOG(LogLevel::WARN, LogComponent::INGEST,
        "Line " << line_number << ": non-finite value " << fields[2]);
    return false;
  }

  TimeSeriesPoint point;
  point.timestamp_ms = *timestamp;
  point.value = *value;
  point.metric = fields.size() > 3 ? fields[3] : "value";
  point.unit = fields.size() > 4 ? fields[4] : "";
  series_[subject].push_back(std::move(point));

  if (fields.size() > 5 && !fields[5].empty())
    households_[fields[5]].push_back(subject);
  return true;
}

std::vector<TimeSeriesPoint>
CsvTimeSeriesSource::fetch(const std::string &subject_id, uint64_t start_ms,
                           uint64_t end_ms, Granularity granularity) {
  auto it = series_.find(subject_id);
  if (it == series_.end())
    return {};

  const auto &points = it->second;
  auto first = std::lower_bound(
      points.begin(), points.end(), start_ms,
      [](const TimeSeriesPoint &p, uint64_t ts) { return p.timestamp_ms < ts; });
  auto last = std::upper_bound(
      first, points.end(), end_ms,
      [](uint64_t ts, const TimeSeriesPoint &p) { return ts < p.timestamp_ms; });

  std::vector<TimeSeriesPoint> in_range(first, last);
  return bucket_points(in_range, granularity);
}

std::vector<std::string>
CsvTimeSeriesSource::devices_in_household(const std::string &household_id) {
  auto it = households_.find(household_id);
  if (it == households_.end())
    return {};
  return it->second;
}

std::vector<std::string> CsvTimeSeriesSource::subjects() const {
  std::vector<std::string> out;
  out.reserve(series_.size());
  for (const auto &entry : series_)
    out.push_back(entry.first);
  return out;
}

std::vector<std::string> CsvTimeSeriesSource::households() const {
  std::vector<std::string> out;
  out.reserve(households_.size());
  for (const auto &entry : households_)
    out.push_back(entry.first);
  return out;
}

TimeRange CsvTimeSeriesSource::full_range() const {
  if (series_.empty())
    return TimeRange{};
  uint64_t earliest = std::numeric_limits<uint64_t>::max();
  uint64_t latest = 0;
  for (const auto &[subject, points] : series_) {
    if (points.empty())
      continue;
    earliest = std::min(earliest, points.front().timestamp_ms);
    latest = std::max(latest, points.back().timestamp_ms);
  }
  if (earliest > latest)
    return TimeRange{};
  return TimeRange{earliest, latest};
}

} // namespace ingest
