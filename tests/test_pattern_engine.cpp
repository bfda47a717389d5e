#include "fixtures/synthetic_series.hpp"

#include <gtest/gtest.h>

using namespace analysis;
using testing_fixtures::AnalysisHarness;
using testing_fixtures::HOUR_MS;

namespace {
const BehavioralPattern *find_pattern(const PatternAnalysisResult &result,
                                      const std::string &type) {
  for (const auto &p : result.behavioral_patterns) {
    if (p.pattern_type == type)
      return &p;
  }
  return nullptr;
}
} // namespace

TEST(PatternEngineTest, DevicePeakAndRoutine) {
  AnalysisHarness harness(24 * 14);
  harness.source->add_series(
      "heater", testing_fixtures::daily_cycle(24 * 14, 800.0, 600.0, 18, 5.0, 11));

  auto result = harness.patterns->analyze_device_patterns("heater", {"1d", "1w"}).get();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.model_label, "hourly_profile_v1");
  EXPECT_EQ(result.privacy_level, "LOCAL_ONLY");

  const auto *peak = find_pattern(result, "peak_usage");
  ASSERT_NE(peak, nullptr);
  EXPECT_EQ(peak->peak_hour, 18);
  EXPECT_EQ(peak->time_of_day, "evening");
  EXPECT_DOUBLE_EQ(peak->confidence, 1.0);

  EXPECT_NE(find_pattern(result, "daily_routine"), nullptr);
  EXPECT_NE(find_pattern(result, "usage_trend"), nullptr);

  ASSERT_EQ(result.interval_patterns.size(), 2u);
  EXPECT_EQ(result.interval_patterns[0].interval, "1d");
  EXPECT_EQ(result.interval_patterns[0].sample_count, 24u);
  EXPECT_DOUBLE_EQ(result.interval_patterns[0].coverage, 1.0);
  EXPECT_EQ(result.interval_patterns[1].sample_count, 24u * 7);
  EXPECT_GT(result.confidence, 0.0);
  EXPECT_LE(result.confidence, 1.0);
}

TEST(PatternEngineTest, UnknownDeviceYieldsEmptySuccess) {
  AnalysisHarness harness(48);
  auto result = harness.patterns->compute_device_patterns("ghost");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.behavioral_patterns.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST(PatternEngineTest, UnknownHouseholdYieldsEmptySuccess) {
  AnalysisHarness harness(48);
  auto result = harness.patterns->analyze_household_patterns("nowhere").get();
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.behavioral_patterns.empty());
  EXPECT_TRUE(result.interval_patterns.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);

  auto model = harness.patterns->build_behavioral_model("nowhere").get();
  EXPECT_TRUE(model.success);
  EXPECT_TRUE(model.routines.empty());
  EXPECT_DOUBLE_EQ(model.confidence, 0.0);
}

TEST(PatternEngineTest, HouseholdRoutineGroupsDevicesPeakingTogether) {
  AnalysisHarness harness(24 * 7);
  harness.source->add_series(
      "washer", testing_fixtures::daily_cycle(24 * 7, 300.0, 250.0, 10, 0.0, 1));
  harness.source->add_series(
      "dryer", testing_fixtures::daily_cycle(24 * 7, 100.0, 80.0, 10, 0.0, 2));
  harness.source->add_series(
      "lamp", testing_fixtures::daily_cycle(24 * 7, 50.0, 40.0, 21, 0.0, 3));
  harness.source->add_household("house-b", {"washer", "dryer", "lamp"});

  auto model = harness.patterns->compute_behavioral_model("house-b");
  ASSERT_TRUE(model.success);
  ASSERT_EQ(model.device_usage.size(), 3u);
  ASSERT_EQ(model.routines.size(), 1u);
  EXPECT_EQ(model.routines[0].hour, 10);
  EXPECT_EQ(model.routines[0].devices,
            (std::vector<std::string>{"dryer", "washer"}));
  EXPECT_NEAR(model.routines[0].confidence, 2.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(model.confidence, 1.0);

  double share = 0.0;
  for (const auto &usage : model.device_usage)
    share += usage.share_of_household;
  EXPECT_NEAR(share, 1.0, 1e-9);

  ASSERT_EQ(model.energy_patterns.size(), 2u);
  EXPECT_EQ(model.energy_patterns[0].pattern_type, "peak_hours");
  EXPECT_EQ(model.energy_patterns[0].hours.front(), 10);

  auto patterns = harness.patterns->compute_household_patterns("house-b", {"1d"});
  ASSERT_TRUE(patterns.success);
  EXPECT_NE(find_pattern(patterns, "household_routine"), nullptr);
  ASSERT_EQ(patterns.interval_patterns.size(), 1u);
  EXPECT_EQ(patterns.interval_patterns[0].sample_count, 24u);
}

TEST(PatternEngineTest, SpikeIsReportedAsAnomaly) {
  AnalysisHarness harness(24 * 7);
  auto points = testing_fixtures::daily_cycle(24 * 7, 200.0, 50.0, 12, 2.0, 5);
  points[100].value += 400.0;
  harness.source->add_series("fridge", points);

  auto result = harness.patterns->detect_anomalies("fridge").get();
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.anomalies.size(), 1u);
  const auto &anomaly = result.anomalies[0];
  EXPECT_EQ(anomaly.timestamp_ms, points[100].timestamp_ms);
  EXPECT_EQ(anomaly.anomaly_type, "spike");
  EXPECT_GT(anomaly.z_score, 3.0);
  EXPECT_GT(anomaly.severity, 0.5);
  EXPECT_LE(anomaly.severity, 1.0);
  EXPECT_DOUBLE_EQ(result.confidence, 1.0);
}

TEST(PatternEngineTest, FlatSeriesHasNoAnomalies) {
  AnalysisHarness harness(72);
  harness.source->add_series("meter", testing_fixtures::constant_series(72, 5.0));
  auto result = harness.patterns->compute_anomalies("meter");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.anomalies.empty());
}

TEST(PatternEngineTest, PredictionsFollowHorizonAndWiden) {
  AnalysisHarness harness(24 * 7);
  auto points = testing_fixtures::daily_cycle(24 * 7, 100.0, 20.0, 6, 3.0, 9);
  harness.source->add_series("thermostat", points);

  auto result = harness.patterns->generate_predictions("thermostat").get();
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.predictions.size(),
            harness.config->patterns.prediction_horizon_steps);

  uint64_t last_ts = points.back().timestamp_ms;
  double previous_width = 0.0;
  for (size_t i = 0; i < result.predictions.size(); ++i) {
    const auto &p = result.predictions[i];
    EXPECT_EQ(p.step, i + 1);
    EXPECT_EQ(p.timestamp_ms, last_ts + (i + 1) * HOUR_MS);
    EXPECT_LE(p.lower_bound, p.predicted_value);
    EXPECT_GE(p.upper_bound, p.predicted_value);
    double width = p.upper_bound - p.lower_bound;
    EXPECT_GT(width, previous_width);
    previous_width = width;
    EXPECT_NEAR(p.confidence, std::pow(0.9, static_cast<double>(i)), 1e-9);
  }
  // Step 6 lands on 05:00, next to the 06:00 peak; step 1 on 00:00
  EXPECT_GT(result.predictions[5].predicted_value,
            result.predictions[0].predicted_value);
}

TEST(PatternEngineTest, ClearDeviceCacheForcesRecompute) {
  AnalysisHarness harness(48);
  harness.source->add_series("meter", testing_fixtures::constant_series(48, 1.0));

  harness.patterns->compute_device_patterns("meter");
  size_t fetches = harness.source->fetch_count();
  harness.patterns->compute_device_patterns("meter");
  EXPECT_EQ(harness.source->fetch_count(), fetches);

  harness.patterns->clear_device_cache("meter");
  harness.patterns->compute_device_patterns("meter");
  EXPECT_EQ(harness.source->fetch_count(), fetches + 1);
}

TEST(PatternEngineTest, SourceFailureMarksResultFailed) {
  AnalysisHarness harness(48);
  harness.source->fail_fetches(true);
  auto result = harness.patterns->compute_predictions("meter");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.predictions.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);

  auto health = harness.patterns->health_status();
  EXPECT_TRUE(health.healthy);
  EXPECT_EQ(health.details.at("model"), "hourly_profile_v1");
}
