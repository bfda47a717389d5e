#ifndef RECOMMENDATION_ENGINE_HPP
#define RECOMMENDATION_ENGINE_HPP

#include "analysis/analysis_types.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "core/health_status.hpp"
#include "recommendation_ledger.hpp"
#include "recommendation_types.hpp"
#include "suggestion_generator.hpp"
#include "utils/worker_pool.hpp"

#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace recommendation {

/**
 * Turns analysis outputs and external suggestions into ranked, explained
 * recommendations and tracks their approval outcomes.
 *
 * Every operation resolves its future with a result object; failures set
 * success=false and an error message instead of throwing.
 */
class RecommendationEngine {
public:
  // suggestions may be null when no candidate generator is deployed
  RecommendationEngine(std::shared_ptr<cache::ResultCache> cache,
                       std::shared_ptr<WorkerPool> pool,
                       std::shared_ptr<const Config::AppConfig> config,
                       std::shared_ptr<ISuggestionGenerator> suggestions = nullptr);

  std::future<RecommendationResponse>
  generate_recommendations(const RecommendationRequest &request,
                           const analysis::AnalysisSnapshot &snapshot);
  std::future<RankingResult>
  rank_recommendations(const std::vector<Recommendation> &recommendations,
                       const std::map<std::string, std::string> &preferences,
                       size_t max_recommendations);
  std::future<ExplanationResult>
  explain_recommendation(const std::string &recommendation_id,
                         const std::string &user_id);
  std::future<FeedbackResult>
  process_feedback(const RecommendationFeedback &feedback);
  std::future<RecommendationAccuracy>
  validate_accuracy(const std::string &recommendation_id);
  std::future<StatsResult> get_stats(const std::string &user_id,
                                     const TimeRange &range);

  RecommendationResponse
  compute_recommendations(const RecommendationRequest &request,
                          const analysis::AnalysisSnapshot &snapshot);
  RankingResult
  compute_ranking(const std::vector<Recommendation> &recommendations,
                  const std::map<std::string, std::string> &preferences,
                  size_t max_recommendations);
  ExplanationResult compute_explanation(const std::string &recommendation_id,
                                        const std::string &user_id);
  FeedbackResult apply_feedback(const RecommendationFeedback &feedback);
  RecommendationAccuracy compute_accuracy(const std::string &recommendation_id);
  StatsResult compute_stats(const std::string &user_id, const TimeRange &range);

  HealthStatus health_status() const;

  // Deterministic id from owner, title and affected subjects
  static std::string make_recommendation_id(
      const std::string &user_id, const std::string &title,
      const std::vector<std::string> &affected_subjects);

private:
  RecommendationResponse
  generate_uncached(const RecommendationRequest &request,
                    const analysis::AnalysisSnapshot &snapshot);
  std::vector<Recommendation>
  drafts_from_analysis(const RecommendationRequest &request,
                       const analysis::AnalysisSnapshot &snapshot) const;
  std::vector<Recommendation>
  drafts_from_suggestions(const RecommendationRequest &request,
                          const analysis::AnalysisSnapshot &snapshot,
                          size_t max_recommendations) const;
  Recommendation make_draft(const std::string &user_id,
                            const std::string &title,
                            const std::string &category, double confidence,
                            const std::vector<std::string> &affected) const;
  std::vector<Recommendation>
  rank(std::vector<Recommendation> recommendations,
       const std::map<std::string, std::string> &preferences,
       size_t max_recommendations) const;
  size_t effective_max(size_t requested) const;
  void invalidate_user_stats(const std::string &user_id);
  void invalidate_user_results(const std::string &user_id);

  std::shared_ptr<cache::ResultCache> cache_;
  std::shared_ptr<WorkerPool> pool_;
  std::shared_ptr<const Config::AppConfig> config_;
  std::shared_ptr<ISuggestionGenerator> suggestions_;
  RecommendationLedger ledger_;
};

} // namespace recommendation

#endif // RECOMMENDATION_ENGINE_HPP
