#include "analysis/fft.hpp"
#include "analysis/frequency_engine.hpp"
#include "fixtures/synthetic_series.hpp"

#include <cmath>
#include <gtest/gtest.h>

using namespace analysis;

namespace {
std::vector<double> sinusoid(size_t n, double cycles) {
  std::vector<double> values(n);
  for (size_t i = 0; i < n; ++i)
    values[i] = std::sin(2.0 * testing_fixtures::PI * cycles * i / n);
  return values;
}
} // namespace

TEST(FftTest, PaddingAndImpulse) {
  EXPECT_EQ(next_power_of_two(1), 1u);
  EXPECT_EQ(next_power_of_two(5), 8u);
  EXPECT_EQ(next_power_of_two(64), 64u);
  EXPECT_TRUE(fft_forward({}).empty());

  // A unit impulse has a flat spectrum
  auto spectrum = fft_forward({1.0, 0.0, 0.0});
  ASSERT_EQ(spectrum.size(), 4u);
  for (const auto &bin : spectrum)
    EXPECT_NEAR(std::abs(bin), 1.0, 1e-12);
}

TEST(FrequencyEngineTest, PureToneDominates) {
  FrequencyEngine engine(Config::FrequencyConfig{});
  auto result = engine.analyze("tone", sinusoid(256, 32));

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.fft_size, 256u);
  EXPECT_EQ(result.components.size(), 128u);
  ASSERT_EQ(result.dominant_frequencies.size(), 5u);

  const auto &top = result.dominant_frequencies.front();
  EXPECT_NEAR(top.frequency, 0.125, 1e-12);
  EXPECT_NEAR(top.amplitude, 128.0, 1e-6);
  EXPECT_NEAR(top.period, 8.0, 1e-9);
  EXPECT_GT(top.significance, 0.999);
  EXPECT_EQ(top.interpretation, "medium frequency pattern");
  EXPECT_EQ(result.components[32].period_label, "8.00h");
  EXPECT_NEAR(result.confidence, 0.85, 1e-12);
}

TEST(FrequencyEngineTest, TwoTonesBothDominateAfterPadding) {
  const size_t n = 200;
  const double f1 = 0.1;
  const double f2 = 0.25;
  std::vector<double> values(n);
  for (size_t i = 0; i < n; ++i)
    values[i] = std::sin(2.0 * testing_fixtures::PI * f1 * i) +
                0.7 * std::sin(2.0 * testing_fixtures::PI * f2 * i);

  FrequencyEngine engine(Config::FrequencyConfig{});
  auto result = engine.analyze("two-tone", values);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.fft_size, 256u);

  const double resolution = 1.0 / static_cast<double>(result.fft_size);
  auto found = [&](double target) {
    for (const auto &d : result.dominant_frequencies) {
      if (std::abs(d.frequency - target) <= resolution)
        return true;
    }
    return false;
  };
  EXPECT_TRUE(found(f1));
  EXPECT_TRUE(found(f2));
}

TEST(FrequencyEngineTest, SamplingRateScalesFrequencies) {
  Config::FrequencyConfig config;
  config.sampling_rate = 4.0; // 15 minute samples
  FrequencyEngine engine(config);
  auto result = engine.analyze("tone", sinusoid(256, 32));
  EXPECT_NEAR(result.dominant_frequencies.front().frequency, 0.5, 1e-12);
  EXPECT_NEAR(result.dominant_frequencies.front().period, 2.0, 1e-9);
}

TEST(FrequencyEngineTest, DailyCycleIsRecognised) {
  FrequencyEngine engine(Config::FrequencyConfig{});
  auto points = testing_fixtures::daily_cycle(512, 0.0, 10.0, 0, 0.0, 1);
  std::vector<double> values;
  for (const auto &p : points)
    values.push_back(p.value);

  auto result = engine.analyze("cycle", values);
  const PeriodicPattern *daily = nullptr;
  for (const auto &pattern : result.periodic_patterns) {
    if (pattern.pattern_type == "daily")
      daily = &pattern;
  }
  ASSERT_NE(daily, nullptr);
  EXPECT_NEAR(daily->period, 512.0 / 21.0, 1e-9);
  EXPECT_GT(daily->strength, 0.5);
  EXPECT_EQ(daily->description, "daily pattern detected");
}

TEST(FrequencyEngineTest, LabelsAndEmptyInput) {
  EXPECT_EQ(FrequencyEngine::period_label(0.0), "\xE2\x88\x9E");
  EXPECT_EQ(FrequencyEngine::period_label(1.0 / 24.0), "24.00h");
  EXPECT_EQ(FrequencyEngine::interpret_frequency(0.005),
            "very low frequency pattern");
  EXPECT_EQ(FrequencyEngine::interpret_frequency(0.05), "low frequency pattern");
  EXPECT_EQ(FrequencyEngine::interpret_frequency(0.7), "high frequency pattern");

  FrequencyEngine engine(Config::FrequencyConfig{});
  auto result = engine.analyze("empty", {});
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.components.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST(FrequencyEngineTest, RejectsInvalidConfig) {
  Config::FrequencyConfig config;
  config.sampling_rate = 0.0;
  EXPECT_THROW(FrequencyEngine{config}, std::invalid_argument);
}
