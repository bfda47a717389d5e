#ifndef CSV_TIME_SERIES_SOURCE_HPP
#define CSV_TIME_SERIES_SOURCE_HPP

#include "time_series_source.hpp"

#include <map>
#include <string>
#include <vector>

namespace ingest {

// Loads a whole CSV file up front. Rows are
//   subject_id,timestamp_ms,value[,metric[,unit[,household_id]]]
// A first line starting with "subject_id" is treated as a header.
class CsvTimeSeriesSource : public ITimeSeriesSource {
public:
  explicit CsvTimeSeriesSource(const std::string &filepath,
                               std::string label = "csv");

  std::vector<TimeSeriesPoint> fetch(const std::string &subject_id,
                                     uint64_t start_ms, uint64_t end_ms,
                                     Granularity granularity) override;
  std::vector<std::string>
  devices_in_household(const std::string &household_id) override;
  std::string source_label() const override { return label_; }

  std::vector<std::string> subjects() const;
  std::vector<std::string> households() const;
  // Earliest and latest timestamps across every subject
  TimeRange full_range() const;
  size_t rows_loaded() const { return rows_loaded_; }
  size_t rows_rejected() const { return rows_rejected_; }

private:
  bool parse_line(const std::string &line, uint64_t line_number);

  std::string label_;
  std::map<std::string, std::vector<TimeSeriesPoint>> series_;
  std::map<std::string, std::vector<std::string>> households_;
  size_t rows_loaded_ = 0;
  size_t rows_rejected_ = 0;
};

} // namespace ingest

#endif // CSV_TIME_SERIES_SOURCE_HPP
