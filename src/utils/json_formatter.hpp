#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/analysis_types.hpp"
#include "core/time_series.hpp"
#include "nlohmann/json.hpp"
#include "recommendation/recommendation_types.hpp"

#include <string>

// Field-by-field JSON mappings for every result type. These are the cache
// value format and the CLI output format, so from_json must accept whatever
// to_json writes.

NLOHMANN_JSON_SERIALIZE_ENUM(Granularity,
                             {{Granularity::FIFTEEN_MINUTES, "15m"},
                              {Granularity::HOURLY, "1h"},
                              {Granularity::DAILY, "1d"}})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeRange, start_ms, end_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeSeriesPoint, timestamp_ms, value,
                                   metric, unit)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeSeriesData, subject_id, range,
                                   granularity, points, aggregated_metrics,
                                   analyzed_at_ms, success, error_message,
                                   data_source, processing_time_ms,
                                   total_points)

namespace analysis {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MovingAveragePoint, timestamp_ms, value)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MovingAverage, window_size, values,
                                   average_value, trend_direction)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SeasonalityInfo, has_seasonality,
                                   seasonality_type, strength, period,
                                   coefficient)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeCluster, cluster_id, label, centroid,
                                   members, size, density)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(StatisticalAnalysisResult, subject_id, mean,
                                   median, std_dev, variance, min, max, range,
                                   sample_count, moving_averages, seasonality,
                                   clusters, confidence, analysis_type,
                                   model_label, processing_time_ms,
                                   analyzed_at_ms, success, error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SeasonalityAnalysisResult, subject_id,
                                   seasonality, sample_count,
                                   processing_time_ms, success, error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeClusteringResult, subject_id, clusters,
                                   sample_count, processing_time_ms, success,
                                   error_message)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FrequencyComponent, frequency, amplitude,
                                   phase, power, period_label)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DominantFrequency, frequency, amplitude,
                                   period, significance, interpretation)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PeriodicPattern, pattern_type, period,
                                   strength, description)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FrequencyAnalysisResult, subject_id,
                                   components, dominant_frequencies,
                                   periodic_patterns, fft_size, sampling_rate,
                                   confidence, processing_time_ms,
                                   analyzed_at_ms, success, error_message)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CorrelationPair, subject_a, subject_b,
                                   coefficient, strength, direction,
                                   interpretation, confidence)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CorrelationCluster, members,
                                   average_correlation, description)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CorrelationAnalysisResult, subject_ids,
                                   matrix, strong_pairs, weak_pairs, clusters,
                                   range, confidence, processing_time_ms,
                                   analyzed_at_ms, success, error_message)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TimeIntervalPattern, interval, mean_value,
                                   relative_to_overall, coverage, sample_count,
                                   confidence)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BehavioralPattern, pattern_type,
                                   description, time_of_day, peak_hour,
                                   strength, confidence)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Anomaly, timestamp_ms, value,
                                   expected_value, z_score, anomaly_type,
                                   severity, description)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Prediction, timestamp_ms, predicted_value,
                                   lower_bound, upper_bound, confidence, step)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PatternAnalysisResult, subject_id,
                                   analyzed_at_ms, confidence,
                                   interval_patterns, behavioral_patterns,
                                   anomalies, predictions, model_label,
                                   processing_time_ms, privacy_level, success,
                                   error_message)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DeviceUsagePattern, device_id, peak_hour,
                                   average_value, share_of_household,
                                   trend_direction)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(HouseholdRoutine, hour, time_of_day,
                                   devices, confidence, description)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EnergyPattern, pattern_type, hours, value,
                                   description)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BehavioralModelResult, household_id,
                                   routines, device_usage, energy_patterns,
                                   confidence, analyzed_at_ms,
                                   processing_time_ms, success, error_message)

} // namespace analysis

namespace recommendation {

NLOHMANN_JSON_SERIALIZE_ENUM(ApprovalStatus,
                             {{ApprovalStatus::PENDING, "pending"},
                              {ApprovalStatus::APPROVED, "approved"},
                              {ApprovalStatus::REJECTED, "rejected"},
                              {ApprovalStatus::IMPLEMENTED, "implemented"},
                              {ApprovalStatus::ROLLED_BACK, "rolled_back"}})

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {{FeedbackType::APPROVAL, "approval"},
                              {FeedbackType::REJECTION, "rejection"},
                              {FeedbackType::IMPLEMENTATION, "implementation"},
                              {FeedbackType::ROLLBACK, "rollback"},
                              {FeedbackType::RATING, "rating"}})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Recommendation, id, title, description,
                                   category, confidence, explanation,
                                   affected_subjects, estimated_impact,
                                   time_to_implement, approval_status,
                                   created_at_ms, source)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RecommendationStats, total, approved,
                                   rejected, pending, implemented,
                                   average_confidence, approval_rate,
                                   implementation_rate, category_breakdown,
                                   average_rating)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RecommendationResponse, request_id, user_id,
                                   generated_at_ms, success, error_message,
                                   recommendations, stats, model_label,
                                   confidence, processing_time_ms,
                                   privacy_level, requires_approval)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AccuracyMetric, name, value, threshold,
                                   passing)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RecommendationAccuracy, recommendation_id,
                                   accuracy_score, confidence_score,
                                   accuracy_level, metrics, validation_method,
                                   processing_time_ms, success, error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExplanationResult, recommendation_id,
                                   user_id, explanation, evidence, success,
                                   error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RankingResult, recommendations, success,
                                   error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(StatsResult, user_id, stats, success,
                                   error_message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FeedbackResult, recommendation_id, status,
                                   success, error_message)

// rating is optional and maps to null
void to_json(nlohmann::json &j, const RecommendationFeedback &feedback);
void from_json(const nlohmann::json &j, RecommendationFeedback &feedback);

} // namespace recommendation

namespace JsonFormatter {

// Compact form for cache values, indented form for the CLI
std::string to_cache_string(const nlohmann::json &value);
std::string to_display_string(const nlohmann::json &value);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
