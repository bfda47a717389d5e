#ifndef RECOMMENDATION_LEDGER_HPP
#define RECOMMENDATION_LEDGER_HPP

#include "core/time_series.hpp"
#include "recommendation_types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recommendation {

// Mutex-guarded record of issued recommendations and their outcomes.
// Confidence values are stored as issued and never rewritten.
class RecommendationLedger {
public:
  struct Entry {
    Recommendation recommendation;
    std::string user_id;
    std::vector<int> ratings;
    std::vector<RecommendationFeedback> history;
    bool ever_approved = false;
    bool ever_implemented = false;
  };

  struct TransitionOutcome {
    bool applied = false;
    ApprovalStatus status = ApprovalStatus::PENDING;
    std::string error_message;
  };

  // No-op for ids already recorded
  void record(const std::string &user_id, const Recommendation &recommendation);

  std::optional<Entry> find(const std::string &recommendation_id) const;

  /**
   * Applies one feedback event. Status-changing feedback must follow
   * pending -> approved|rejected, approved -> implemented,
   * implemented -> rolled_back. A rating, when present, must be 1-5.
   */
  TransitionOutcome apply_feedback(const RecommendationFeedback &feedback);

  // Multiplier for future drafts of a category from its average rating:
  // 0.8 at 1 star, 1.2 at 5 stars, 1.0 when unrated
  double category_factor(const std::string &category) const;

  // range.end_ms == 0 means unbounded
  RecommendationStats stats_for_user(const std::string &user_id,
                                     const TimeRange &range) const;

  size_t size() const;

private:
  std::map<std::string, Entry> entries_;
  std::map<std::string, std::vector<int>> category_ratings_;
  mutable std::mutex mutex_;
};

} // namespace recommendation

#endif // RECOMMENDATION_LEDGER_HPP
