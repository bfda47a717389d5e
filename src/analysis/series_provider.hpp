#ifndef SERIES_PROVIDER_HPP
#define SERIES_PROVIDER_HPP

#include "cache/result_cache.hpp"
#include "core/time_series.hpp"
#include "ingest/time_series_source.hpp"

#include <memory>
#include <string>
#include <vector>

namespace analysis {

// Cached time-series retrieval shared by every analysis. Source failures are
// reported through TimeSeriesData::success rather than thrown.
class SeriesProvider {
public:
  SeriesProvider(std::shared_ptr<ingest::ITimeSeriesSource> source,
                 std::shared_ptr<cache::ResultCache> cache);

  TimeSeriesData load(const std::string &subject_id, const TimeRange &range,
                      Granularity granularity);

  // Throws whatever the source throws
  std::vector<std::string> devices_in_household(const std::string &household_id);

  std::string source_label() const;

private:
  TimeSeriesData fetch_uncached(const std::string &subject_id,
                                const TimeRange &range,
                                Granularity granularity);

  std::shared_ptr<ingest::ITimeSeriesSource> source_;
  std::shared_ptr<cache::ResultCache> cache_;
};

} // namespace analysis

#endif // SERIES_PROVIDER_HPP
