#include "ingest/csv_time_series_source.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using ingest::CsvTimeSeriesSource;

class CsvSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "homesense_csv_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override { std::filesystem::remove_all(test_dir); }

  std::string write_csv(const std::string &content) {
    auto path = test_dir / "series.csv";
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(CsvSourceTest, LoadsRowsAndSkipsNoise) {
  auto path = write_csv(
      "subject_id,timestamp_ms,value,metric,unit,household_id\n"
      "# exported from the hub\n"
      "heater,3600000,100,power,watts,house-a\n"
      "heater,0,50,power,watts,house-a\n"
      "lights,0,10,power,watts,house-a\n"
      "fridge,0,120\n"
      "broken,not-a-time,1\n"
      "broken,5,\n"
      "fridge,7200000,nan\n"
      "heater,7200000,-inf\n"
      "too,few\n");
  CsvTimeSeriesSource source(path, "hub-export");

  EXPECT_EQ(source.rows_loaded(), 4u);
  EXPECT_EQ(source.rows_rejected(), 5u);
  EXPECT_EQ(source.source_label(), "hub-export");
  EXPECT_EQ(source.subjects(),
            (std::vector<std::string>{"fridge", "heater", "lights"}));
  EXPECT_EQ(source.households(), (std::vector<std::string>{"house-a"}));
  EXPECT_EQ(source.devices_in_household("house-a"),
            (std::vector<std::string>{"heater", "lights"}));
  EXPECT_TRUE(source.devices_in_household("house-z").empty());

  auto range = source.full_range();
  EXPECT_EQ(range.start_ms, 0u);
  EXPECT_EQ(range.end_ms, 3600000u);
}

TEST_F(CsvSourceTest, FetchSortsFiltersAndBuckets) {
  auto path = write_csv("meter,3600000,30\n"
                        "meter,0,10\n"
                        "meter,900000,20\n"
                        "meter,7200000,99\n");
  CsvTimeSeriesSource source(path);

  auto hourly = source.fetch("meter", 0, 3600000, Granularity::HOURLY);
  ASSERT_EQ(hourly.size(), 2u);
  EXPECT_EQ(hourly[0].timestamp_ms, 0u);
  EXPECT_DOUBLE_EQ(hourly[0].value, 15.0);
  EXPECT_EQ(hourly[0].metric, "value");
  EXPECT_DOUBLE_EQ(hourly[1].value, 30.0);

  auto quarter = source.fetch("meter", 0, 1000000, Granularity::FIFTEEN_MINUTES);
  ASSERT_EQ(quarter.size(), 2u);
  EXPECT_EQ(quarter[1].timestamp_ms, 900000u);

  EXPECT_TRUE(source.fetch("nobody", 0, 3600000, Granularity::HOURLY).empty());
  EXPECT_EQ(source.source_label(), "csv");
}

TEST_F(CsvSourceTest, MissingFileThrows) {
  EXPECT_THROW(CsvTimeSeriesSource((test_dir / "absent.csv").string()),
               std::runtime_error);
}

TEST(BucketPointsTest, AveragesWithinDailyBuckets) {
  std::vector<TimeSeriesPoint> raw{{0, 1.0, "energy", "kwh"},
                                   {3600000, 3.0, "energy", "kwh"},
                                   {86400000, 10.0, "energy", "kwh"}};
  auto daily = ingest::bucket_points(raw, Granularity::DAILY);
  ASSERT_EQ(daily.size(), 2u);
  EXPECT_DOUBLE_EQ(daily[0].value, 2.0);
  EXPECT_EQ(daily[0].unit, "kwh");
  EXPECT_EQ(daily[1].timestamp_ms, 86400000u);
}
