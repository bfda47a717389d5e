#include "analysis/correlation_engine.hpp"
#include "fixtures/synthetic_series.hpp"

#include <gtest/gtest.h>

using namespace analysis;
using testing_fixtures::AnalysisHarness;

namespace {
std::map<std::string, std::vector<double>> sample_series() {
  std::map<std::string, std::vector<double>> series;
  for (int i = 1; i <= 10; ++i) {
    series["a"].push_back(i);
    series["b"].push_back(2.0 * i);
    series["c"].push_back(11.0 - i);
    series["d"].push_back(i % 2 == 1 ? 1.0 : -1.0);
  }
  return series;
}
} // namespace

TEST(PearsonTest, ReferenceValues) {
  std::vector<double> x{1, 2, 3, 4, 5};
  EXPECT_NEAR(pearson_correlation(x, x), 1.0, 1e-12);
  EXPECT_NEAR(pearson_correlation(x, {5, 4, 3, 2, 1}), -1.0, 1e-12);
  // Constant input has no defined correlation
  EXPECT_DOUBLE_EQ(pearson_correlation(x, {2, 2, 2, 2, 2}), 0.0);
  EXPECT_DOUBLE_EQ(pearson_correlation(x, {1, 2}), 0.0);
  EXPECT_DOUBLE_EQ(pearson_correlation({}, {}), 0.0);
}

TEST(CorrelationEngineTest, MatrixIsSymmetricWithUnitDiagonal) {
  CorrelationEngine engine(Config::CorrelationConfig{});
  auto result = engine.analyze(sample_series(), TimeRange{0, 10});

  ASSERT_EQ(result.subject_ids, (std::vector<std::string>{"a", "b", "c", "d"}));
  ASSERT_EQ(result.matrix.size(), 4u);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_DOUBLE_EQ(result.matrix[i][i], 1.0);
    for (size_t j = 0; j < 4; ++j)
      EXPECT_DOUBLE_EQ(result.matrix[i][j], result.matrix[j][i]);
  }
  EXPECT_NEAR(result.matrix[0][1], 1.0, 1e-12);
  EXPECT_NEAR(result.matrix[0][2], -1.0, 1e-12);
  EXPECT_NEAR(result.matrix[0][3], -5.0 / std::sqrt(825.0), 1e-12);
  EXPECT_DOUBLE_EQ(result.confidence, 0.87);
}

TEST(CorrelationEngineTest, PairsAreClassifiedByStrength) {
  CorrelationEngine engine(Config::CorrelationConfig{});
  auto result = engine.analyze(sample_series(), TimeRange{0, 10});

  ASSERT_EQ(result.strong_pairs.size(), 3u);
  EXPECT_EQ(result.strong_pairs[0].subject_a, "a");
  EXPECT_EQ(result.strong_pairs[0].subject_b, "b");
  EXPECT_EQ(result.strong_pairs[0].direction, "positive");
  EXPECT_EQ(result.strong_pairs[0].strength, "strong");
  EXPECT_DOUBLE_EQ(result.strong_pairs[0].confidence, 0.95);
  EXPECT_EQ(result.strong_pairs[1].direction, "negative");
  EXPECT_EQ(result.strong_pairs[1].interpretation, "Strong negative correlation");

  ASSERT_EQ(result.weak_pairs.size(), 3u);
  for (const auto &pair : result.weak_pairs) {
    EXPECT_EQ(pair.subject_b, "d");
    EXPECT_DOUBLE_EQ(pair.confidence, 0.6);
  }
}

TEST(CorrelationEngineTest, ClustersGroupInLexicographicOrder) {
  CorrelationEngine engine(Config::CorrelationConfig{});
  auto result = engine.analyze(sample_series(), TimeRange{0, 10});

  ASSERT_EQ(result.clusters.size(), 1u);
  EXPECT_EQ(result.clusters[0].members,
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_NEAR(result.clusters[0].average_correlation, -1.0 / 3.0, 1e-9);
  EXPECT_EQ(result.clusters[0].description, "Device cluster with 3 devices");
}

TEST(CorrelationEngineTest, SingleSubjectHasNoConfidence) {
  CorrelationEngine engine(Config::CorrelationConfig{});
  std::map<std::string, std::vector<double>> one{{"solo", {1, 2, 3}}};
  auto result = engine.analyze(one, TimeRange{});
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
  EXPECT_TRUE(result.strong_pairs.empty());
  EXPECT_TRUE(result.clusters.empty());
}

TEST(AlignTest, KeepsOnlySharedTimestamps) {
  TimeSeriesData a;
  a.subject_id = "a";
  a.points = {{1, 1.0, "", ""}, {2, 2.0, "", ""}, {3, 3.0, "", ""}};
  TimeSeriesData b;
  b.subject_id = "b";
  b.points = {{2, 20.0, "", ""}, {3, 30.0, "", ""}, {4, 40.0, "", ""}};
  TimeSeriesData empty;
  empty.subject_id = "empty";

  auto aligned = align_on_common_timestamps({a, b, empty});
  EXPECT_EQ(aligned["a"], (std::vector<double>{2.0, 3.0}));
  EXPECT_EQ(aligned["b"], (std::vector<double>{20.0, 30.0}));
  EXPECT_TRUE(aligned["empty"].empty());
}

TEST(AnalyticsServiceTest, CorrelationIsOrderIndependentAndCached) {
  AnalysisHarness harness(24 * 3);
  auto cycle = testing_fixtures::daily_cycle(24 * 3, 100.0, 30.0, 18, 0.0, 1);
  harness.source->add_series("heater", cycle);
  harness.source->add_series("thermostat", cycle);
  auto range = harness.analytics->lookback_range();

  auto first =
      harness.analytics->analyze_correlation({"heater", "thermostat"}, range).get();
  ASSERT_TRUE(first.success);
  ASSERT_EQ(first.strong_pairs.size(), 1u);
  EXPECT_NEAR(first.strong_pairs[0].coefficient, 1.0, 1e-9);
  EXPECT_EQ(first.strong_pairs[0].direction, "positive");
  size_t fetches = harness.source->fetch_count();

  auto swapped =
      harness.analytics->analyze_correlation({"thermostat", "heater"}, range).get();
  EXPECT_EQ(harness.source->fetch_count(), fetches);
  EXPECT_EQ(swapped.subject_ids, first.subject_ids);
}

TEST(AnalyticsServiceTest, CorrelationFailsWhenAnySeriesIsUnavailable) {
  AnalysisHarness harness(24);
  harness.source->fail_fetches(true);
  auto result = harness.analytics
                    ->compute_correlation({"x", "y"},
                                          harness.analytics->lookback_range());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.strong_pairs.empty());
  EXPECT_EQ(result.subject_ids, (std::vector<std::string>{"x", "y"}));
}
