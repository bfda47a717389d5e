#include "learning/hourly_profile.hpp"
#include "learning/rolling_statistics.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>

using namespace learning;

TEST(RollingStatisticsTest, EWMAConvergence) {
  RollingStatistics stats(0.1);
  for (int i = 0; i < 1000; ++i) {
    stats.add_value(10.0);
  }
  EXPECT_NEAR(stats.get_mean(), 10.0, 1e-9);
  EXPECT_NEAR(stats.get_variance(), 0.0, 1e-9);
  EXPECT_EQ(stats.get_sample_count(), 1000u);
}

TEST(RollingStatisticsTest, FirstValueSeedsLevel) {
  RollingStatistics stats(0.5);
  stats.add_value(4.0);
  EXPECT_DOUBLE_EQ(stats.get_mean(), 4.0);
  stats.add_value(8.0);
  // level moves halfway, variance folds in half the squared step
  EXPECT_DOUBLE_EQ(stats.get_mean(), 6.0);
  EXPECT_DOUBLE_EQ(stats.get_variance(), 8.0);
  EXPECT_DOUBLE_EQ(stats.get_standard_deviation(), std::sqrt(8.0));
}

TEST(RollingStatisticsTest, NoisyStreamTracksMean) {
  RollingStatistics stats(0.05);
  std::mt19937 gen(42);
  std::normal_distribution<> dist(50.0, 5.0);
  for (int i = 0; i < 2000; ++i) {
    stats.add_value(dist(gen));
  }
  EXPECT_NEAR(stats.get_mean(), 50.0, 3.0);
  EXPECT_GT(stats.get_standard_deviation(), 2.0);
  EXPECT_LT(stats.get_standard_deviation(), 10.0);
}

TEST(RollingStatisticsTest, EstablishmentAndReset) {
  RollingStatistics stats;
  for (int i = 0; i < 5; ++i)
    stats.add_value(i);
  EXPECT_TRUE(stats.is_established(5));
  EXPECT_FALSE(stats.is_established(6));
  stats.reset();
  EXPECT_EQ(stats.get_sample_count(), 0u);
  EXPECT_DOUBLE_EQ(stats.get_mean(), 0.0);
}

TEST(RollingStatisticsTest, RejectsInvalidAlpha) {
  EXPECT_THROW(RollingStatistics(0.0), std::invalid_argument);
  EXPECT_THROW(RollingStatistics(1.5), std::invalid_argument);
}

TEST(HourlyProfileTest, PeakAndOffsets) {
  HourlyProfile profile;
  uint64_t base = 1704067200000ULL; // midnight UTC
  for (int day = 0; day < 3; ++day) {
    for (int hour = 0; hour < 24; ++hour) {
      double value = (hour == 19) ? 30.0 : 10.0;
      profile.add_observation(value, base + (day * 24 + hour) * 3600000ULL);
    }
  }
  EXPECT_EQ(profile.hours_covered(), 24u);
  EXPECT_EQ(profile.peak_hour(), 19);
  EXPECT_NEAR(profile.overall_mean(), 10.0 + 20.0 / 24.0, 1e-9);
  EXPECT_DOUBLE_EQ(profile.hour_mean(19), 30.0);
  EXPECT_NEAR(profile.seasonal_offset(base + 19 * 3600000ULL),
              30.0 - profile.overall_mean(), 1e-9);
  EXPECT_GT(profile.peak_strength(), 0.9);
  EXPECT_STREQ(time_of_day_bucket(profile.peak_hour()), "evening");
}

TEST(HourlyProfileTest, EmptyProfile) {
  HourlyProfile profile;
  EXPECT_EQ(profile.peak_hour(), -1);
  EXPECT_DOUBLE_EQ(profile.peak_strength(), 0.0);
  EXPECT_DOUBLE_EQ(profile.expected_value(0), 0.0);
  EXPECT_STREQ(time_of_day_bucket(-1), "unknown");
}
