#include "recommendation_ledger.hpp"

#include <numeric>

namespace recommendation {

namespace {
std::optional<ApprovalStatus> target_status(FeedbackType type) {
  switch (type) {
  case FeedbackType::APPROVAL:
    return ApprovalStatus::APPROVED;
  case FeedbackType::REJECTION:
    return ApprovalStatus::REJECTED;
  case FeedbackType::IMPLEMENTATION:
    return ApprovalStatus::IMPLEMENTED;
  case FeedbackType::ROLLBACK:
    return ApprovalStatus::ROLLED_BACK;
  case FeedbackType::RATING:
    return std::nullopt;
  }
  return std::nullopt;
}

double average(const std::vector<int> &values) {
  if (values.empty())
    return 0.0;
  return static_cast<double>(std::accumulate(values.begin(), values.end(), 0)) /
         values.size();
}
} // namespace

void RecommendationLedger::record(const std::string &user_id,
                                  const Recommendation &recommendation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.count(recommendation.id))
    return;
  Entry entry;
  entry.recommendation = recommendation;
  entry.user_id = user_id;
  entries_.emplace(recommendation.id, std::move(entry));
}

std::optional<RecommendationLedger::Entry>
RecommendationLedger::find(const std::string &recommendation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(recommendation_id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

RecommendationLedger::TransitionOutcome
RecommendationLedger::apply_feedback(const RecommendationFeedback &feedback) {
  TransitionOutcome outcome;
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = entries_.find(feedback.recommendation_id);
  if (it == entries_.end()) {
    outcome.error_message =
        "unknown recommendation: " + feedback.recommendation_id;
    return outcome;
  }
  Entry &entry = it->second;
  outcome.status = entry.recommendation.approval_status;

  if (feedback.rating && (*feedback.rating < 1 || *feedback.rating > 5)) {
    outcome.error_message = "rating must be between 1 and 5";
    return outcome;
  }
  if (feedback.feedback_type == FeedbackType::RATING && !feedback.rating) {
    outcome.error_message = "rating feedback requires a rating";
    return outcome;
  }

  if (auto target = target_status(feedback.feedback_type)) {
    ApprovalStatus current = entry.recommendation.approval_status;
    if (!is_valid_transition(current, *target)) {
      outcome.error_message = std::string("cannot move from ") +
                              approval_status_to_string(current) + " to " +
                              approval_status_to_string(*target);
      return outcome;
    }
    entry.recommendation.approval_status = *target;
    if (*target == ApprovalStatus::APPROVED)
      entry.ever_approved = true;
    if (*target == ApprovalStatus::IMPLEMENTED)
      entry.ever_implemented = true;
  }

  if (feedback.rating) {
    entry.ratings.push_back(*feedback.rating);
    category_ratings_[entry.recommendation.category].push_back(
        *feedback.rating);
  }
  entry.history.push_back(feedback);

  outcome.applied = true;
  outcome.status = entry.recommendation.approval_status;
  return outcome;
}

double RecommendationLedger::category_factor(const std::string &category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = category_ratings_.find(category);
  if (it == category_ratings_.end() || it->second.empty())
    return 1.0;
  return 0.8 + 0.4 * (average(it->second) - 1.0) / 4.0;
}

RecommendationStats
RecommendationLedger::stats_for_user(const std::string &user_id,
                                     const TimeRange &range) const {
  RecommendationStats stats;
  std::vector<int> ratings;
  double confidence_sum = 0.0;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, entry] : entries_) {
    if (entry.user_id != user_id)
      continue;
    const auto &rec = entry.recommendation;
    if (range.end_ms != 0 && !range.contains(rec.created_at_ms))
      continue;

    stats.total++;
    confidence_sum += rec.confidence;
    stats.category_breakdown[rec.category]++;
    if (rec.approval_status == ApprovalStatus::PENDING)
      stats.pending++;
    if (rec.approval_status == ApprovalStatus::REJECTED)
      stats.rejected++;
    if (entry.ever_approved)
      stats.approved++;
    if (entry.ever_implemented)
      stats.implemented++;
    ratings.insert(ratings.end(), entry.ratings.begin(), entry.ratings.end());
  }

  if (stats.total > 0)
    stats.average_confidence = confidence_sum / stats.total;
  size_t decided = stats.approved + stats.rejected;
  if (decided > 0)
    stats.approval_rate = static_cast<double>(stats.approved) / decided;
  if (stats.approved > 0)
    stats.implementation_rate =
        static_cast<double>(stats.implemented) / stats.approved;
  stats.average_rating = average(ratings);
  return stats;
}

size_t RecommendationLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace recommendation
