#ifndef RECOMMENDATION_TYPES_HPP
#define RECOMMENDATION_TYPES_HPP

#include "core/time_series.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace recommendation {

enum class ApprovalStatus { PENDING, APPROVED, REJECTED, IMPLEMENTED, ROLLED_BACK };

const char *approval_status_to_string(ApprovalStatus status);
std::optional<ApprovalStatus> parse_approval_status(const std::string &label);

// Legal moves: pending -> approved|rejected, approved -> implemented,
// implemented -> rolled_back
bool is_valid_transition(ApprovalStatus from, ApprovalStatus to);

enum class FeedbackType { APPROVAL, REJECTION, IMPLEMENTATION, ROLLBACK, RATING };

const char *feedback_type_to_string(FeedbackType type);
std::optional<FeedbackType> parse_feedback_type(const std::string &label);

struct Recommendation {
  std::string id;
  std::string title;
  std::string description;
  std::string category; // automation, optimization, safety, energy
  double confidence = 0.0;
  std::string explanation;
  std::vector<std::string> affected_subjects;
  std::string estimated_impact;
  std::string time_to_implement;
  ApprovalStatus approval_status = ApprovalStatus::PENDING;
  uint64_t created_at_ms = 0;
  std::string source; // analysis, suggestion
};

struct RecommendationRequest {
  std::string user_id;
  std::string household_id;
  std::string context;
  std::map<std::string, std::string> preferences;
  std::string privacy_level = "LOCAL_ONLY";
  std::vector<std::string> device_ids;
  std::vector<std::string> type_filter; // empty accepts every category
  size_t max_recommendations = 0;       // 0 falls back to the configured default
  TimeRange range;
};

struct RecommendationStats {
  size_t total = 0;
  size_t approved = 0;
  size_t rejected = 0;
  size_t pending = 0;
  size_t implemented = 0;
  double average_confidence = 0.0;
  double approval_rate = 0.0;
  double implementation_rate = 0.0;
  std::map<std::string, size_t> category_breakdown;
  double average_rating = 0.0;
};

struct RecommendationResponse {
  std::string request_id;
  std::string user_id;
  uint64_t generated_at_ms = 0;
  bool success = true;
  std::string error_message;
  std::vector<Recommendation> recommendations;
  RecommendationStats stats;
  std::string model_label;
  double confidence = 0.0;
  uint64_t processing_time_ms = 0;
  std::string privacy_level;
  bool requires_approval = true;
};

struct RecommendationFeedback {
  std::string recommendation_id;
  std::string user_id;
  FeedbackType feedback_type = FeedbackType::RATING;
  std::optional<int> rating; // 1-5
  std::string comment;
  uint64_t timestamp_ms = 0;
};

struct FeedbackResult {
  std::string recommendation_id;
  ApprovalStatus status = ApprovalStatus::PENDING;
  bool success = true;
  std::string error_message;
};

struct AccuracyMetric {
  std::string name;
  double value = 0.0;
  double threshold = 0.0;
  bool passing = false;
};

struct RecommendationAccuracy {
  std::string recommendation_id;
  double accuracy_score = 0.0;
  double confidence_score = 0.0;
  std::string accuracy_level; // high, medium, low
  std::vector<AccuracyMetric> metrics;
  std::string validation_method;
  uint64_t processing_time_ms = 0;
  bool success = true;
  std::string error_message;
};

struct ExplanationResult {
  std::string recommendation_id;
  std::string user_id;
  std::string explanation;
  std::vector<std::string> evidence;
  bool success = true;
  std::string error_message;
};

struct RankingResult {
  std::vector<Recommendation> recommendations;
  bool success = true;
  std::string error_message;
};

struct StatsResult {
  std::string user_id;
  RecommendationStats stats;
  bool success = true;
  std::string error_message;
};

// Opaque draft handed over by the candidate-suggestion collaborator
struct SuggestionDraft {
  std::string title;
  std::string description;
  std::string category;
  double claimed_confidence = 0.0;
  std::vector<std::string> affected_subjects;
  std::string estimated_impact;
  std::string time_to_implement;
};

} // namespace recommendation

#endif // RECOMMENDATION_TYPES_HPP
