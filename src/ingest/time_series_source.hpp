#ifndef TIME_SERIES_SOURCE_HPP
#define TIME_SERIES_SOURCE_HPP

#include "core/time_series.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ingest {

// Raw-event store collaborator. Implementations may throw on transport
// failures; the analysis services catch at their operation boundary.
class ITimeSeriesSource {
public:
  virtual ~ITimeSeriesSource() = default;

  // Points in [start_ms, end_ms], bucketed to the granularity and ordered by
  // timestamp. An unknown subject yields an empty vector.
  virtual std::vector<TimeSeriesPoint> fetch(const std::string &subject_id,
                                             uint64_t start_ms,
                                             uint64_t end_ms,
                                             Granularity granularity) = 0;

  // Device ids registered under a household, sorted. Empty when unknown.
  virtual std::vector<std::string>
  devices_in_household(const std::string &household_id) = 0;

  virtual std::string source_label() const = 0;
};

// Averages raw points into granularity-wide buckets keyed by bucket start
std::vector<TimeSeriesPoint>
bucket_points(const std::vector<TimeSeriesPoint> &raw, Granularity granularity);

} // namespace ingest

#endif // TIME_SERIES_SOURCE_HPP
