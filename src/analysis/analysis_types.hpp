#ifndef ANALYSIS_TYPES_HPP
#define ANALYSIS_TYPES_HPP

#include "core/time_series.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace analysis {

// --- Statistical ---

struct MovingAveragePoint {
  uint64_t timestamp_ms = 0;
  double value = 0.0;
};

struct MovingAverage {
  size_t window_size = 0;
  std::vector<MovingAveragePoint> values;
  double average_value = 0.0;
  std::string trend_direction = "flat"; // up, down, flat
};

struct SeasonalityInfo {
  bool has_seasonality = false;
  std::string seasonality_type = "none";
  double strength = 0.0;
  size_t period = 0;
  double coefficient = 0.0;
};

struct TimeCluster {
  size_t cluster_id = 0;
  std::string label;
  double centroid = 0.0;
  std::vector<TimeSeriesPoint> members;
  size_t size = 0;
  double density = 0.0;
};

struct StatisticalAnalysisResult {
  std::string subject_id;
  double mean = 0.0;
  double median = 0.0;
  double std_dev = 0.0;
  double variance = 0.0;
  double min = 0.0;
  double max = 0.0;
  double range = 0.0;
  size_t sample_count = 0;
  std::vector<MovingAverage> moving_averages;
  SeasonalityInfo seasonality;
  std::vector<TimeCluster> clusters;
  double confidence = 0.0;
  std::string analysis_type = "descriptive";
  std::string model_label;
  uint64_t processing_time_ms = 0;
  uint64_t analyzed_at_ms = 0;
  bool success = true;
  std::string error_message;
};

struct SeasonalityAnalysisResult {
  std::string subject_id;
  SeasonalityInfo seasonality;
  size_t sample_count = 0;
  uint64_t processing_time_ms = 0;
  bool success = true;
  std::string error_message;
};

struct TimeClusteringResult {
  std::string subject_id;
  std::vector<TimeCluster> clusters;
  size_t sample_count = 0;
  uint64_t processing_time_ms = 0;
  bool success = true;
  std::string error_message;
};

// --- Frequency ---

struct FrequencyComponent {
  double frequency = 0.0;
  double amplitude = 0.0;
  double phase = 0.0;
  double power = 0.0;
  std::string period_label;
};

struct DominantFrequency {
  double frequency = 0.0;
  double amplitude = 0.0;
  double period = 0.0; // 0 for the DC bin
  double significance = 0.0;
  std::string interpretation;
};

struct PeriodicPattern {
  std::string pattern_type; // daily, weekly, monthly
  double period = 0.0;
  double strength = 0.0;
  std::string description;
};

struct FrequencyAnalysisResult {
  std::string subject_id;
  std::vector<FrequencyComponent> components;
  std::vector<DominantFrequency> dominant_frequencies;
  std::vector<PeriodicPattern> periodic_patterns;
  size_t fft_size = 0;
  double sampling_rate = 0.0;
  double confidence = 0.0;
  uint64_t processing_time_ms = 0;
  uint64_t analyzed_at_ms = 0;
  bool success = true;
  std::string error_message;
};

// --- Correlation ---

struct CorrelationPair {
  std::string subject_a;
  std::string subject_b;
  double coefficient = 0.0;
  std::string strength;  // strong, weak
  std::string direction; // positive, negative
  std::string interpretation;
  double confidence = 0.0;
};

struct CorrelationCluster {
  std::vector<std::string> members;
  double average_correlation = 0.0;
  std::string description;
};

struct CorrelationAnalysisResult {
  std::vector<std::string> subject_ids;
  std::vector<std::vector<double>> matrix;
  std::vector<CorrelationPair> strong_pairs;
  std::vector<CorrelationPair> weak_pairs;
  std::vector<CorrelationCluster> clusters;
  TimeRange range;
  double confidence = 0.0;
  uint64_t processing_time_ms = 0;
  uint64_t analyzed_at_ms = 0;
  bool success = true;
  std::string error_message;
};

// --- Patterns ---

struct TimeIntervalPattern {
  std::string interval; // 1d, 1w, 1mo ...
  double mean_value = 0.0;
  double relative_to_overall = 0.0; // interval mean / overall mean
  double coverage = 0.0;            // share of expected samples present
  size_t sample_count = 0;
  double confidence = 0.0;
};

struct BehavioralPattern {
  std::string pattern_type; // peak_usage, daily_routine, usage_trend
  std::string description;
  std::string time_of_day; // night, morning, afternoon, evening
  int peak_hour = -1;
  double strength = 0.0;
  double confidence = 0.0;
};

struct Anomaly {
  uint64_t timestamp_ms = 0;
  double value = 0.0;
  double expected_value = 0.0;
  double z_score = 0.0;
  std::string anomaly_type; // spike, drop
  double severity = 0.0;
  std::string description;
};

struct Prediction {
  uint64_t timestamp_ms = 0;
  double predicted_value = 0.0;
  double lower_bound = 0.0;
  double upper_bound = 0.0;
  double confidence = 0.0;
  size_t step = 0;
};

struct PatternAnalysisResult {
  std::string subject_id;
  uint64_t analyzed_at_ms = 0;
  double confidence = 0.0;
  std::vector<TimeIntervalPattern> interval_patterns;
  std::vector<BehavioralPattern> behavioral_patterns;
  std::vector<Anomaly> anomalies;
  std::vector<Prediction> predictions;
  std::string model_label;
  uint64_t processing_time_ms = 0;
  std::string privacy_level;
  bool success = true;
  std::string error_message;
};

struct DeviceUsagePattern {
  std::string device_id;
  int peak_hour = -1;
  double average_value = 0.0;
  double share_of_household = 0.0;
  std::string trend_direction = "flat";
};

struct HouseholdRoutine {
  int hour = -1;
  std::string time_of_day;
  std::vector<std::string> devices;
  double confidence = 0.0;
  std::string description;
};

struct EnergyPattern {
  std::string pattern_type; // peak_hours, base_load
  std::vector<int> hours;
  double value = 0.0;
  std::string description;
};

struct BehavioralModelResult {
  std::string household_id;
  std::vector<HouseholdRoutine> routines;
  std::vector<DeviceUsagePattern> device_usage;
  std::vector<EnergyPattern> energy_patterns;
  double confidence = 0.0;
  uint64_t analyzed_at_ms = 0;
  uint64_t processing_time_ms = 0;
  bool success = true;
  std::string error_message;
};

// Latest analysis outputs the recommendation engine draws from
struct AnalysisSnapshot {
  std::vector<StatisticalAnalysisResult> statistics;
  std::vector<PatternAnalysisResult> patterns;
  std::vector<CorrelationAnalysisResult> correlations;
};

} // namespace analysis

#endif // ANALYSIS_TYPES_HPP
