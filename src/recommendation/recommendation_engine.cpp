#include "recommendation_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace recommendation {

namespace {
const std::set<std::string> CATEGORIES = {"automation", "optimization",
                                          "safety", "energy"};

std::string hour_label(int hour) {
  std::ostringstream oss;
  oss << std::setw(2) << std::setfill('0') << hour << ":00";
  return oss.str();
}

std::string fixed2(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

std::string impact_for(const std::string &category) {
  if (category == "energy")
    return "Lower consumption during peak periods";
  if (category == "safety")
    return "Earlier detection of faults";
  if (category == "optimization")
    return "Less overlapping load";
  return "Fewer manual actions";
}

std::string effort_for(const std::string &category) {
  if (category == "safety")
    return "15 minutes";
  if (category == "energy")
    return "10 minutes";
  return "5 minutes";
}

std::string join(const std::vector<std::string> &parts, const char *sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out += sep;
    out += parts[i];
  }
  return out;
}

std::string context_hash(const RecommendationRequest &request) {
  auto devices = request.device_ids;
  std::sort(devices.begin(), devices.end());
  auto filter = request.type_filter;
  std::sort(filter.begin(), filter.end());

  std::vector<std::string> parts = {request.household_id,
                                    request.context,
                                    Utils::to_lower_copy(request.privacy_level),
                                    join(devices, ","),
                                    join(filter, ","),
                                    std::to_string(request.max_recommendations),
                                    request.range.to_key()};
  for (const auto &[key, value] : request.preferences)
    parts.push_back(key + "=" + value);
  return Utils::hash_to_hex(Utils::stable_hash(parts));
}

void fail_operation(const char *operation, LogComponent component,
                    const std::string &message) {
  LOG(LogLevel::ERROR, component, operation << " failed: " << message);
  MetricsRegistry::instance().operation_failure(operation).Increment();
}
} // namespace

RecommendationEngine::RecommendationEngine(
    std::shared_ptr<cache::ResultCache> cache, std::shared_ptr<WorkerPool> pool,
    std::shared_ptr<const Config::AppConfig> config,
    std::shared_ptr<ISuggestionGenerator> suggestions)
    : cache_(std::move(cache)), pool_(std::move(pool)),
      config_(std::move(config)), suggestions_(std::move(suggestions)) {
  if (!cache_ || !pool_ || !config_)
    throw std::invalid_argument(
        "RecommendationEngine requires a cache, pool and config");
}

std::string RecommendationEngine::make_recommendation_id(
    const std::string &user_id, const std::string &title,
    const std::vector<std::string> &affected_subjects) {
  auto subjects = affected_subjects;
  std::sort(subjects.begin(), subjects.end());
  return "rec-" + Utils::hash_to_hex(Utils::stable_hash(
                      {user_id, title, join(subjects, ",")}));
}

size_t RecommendationEngine::effective_max(size_t requested) const {
  return requested > 0 ? requested
                       : config_->recommendation.default_max_recommendations;
}

// --- Async entry points ---

std::future<RecommendationResponse> RecommendationEngine::generate_recommendations(
    const RecommendationRequest &request,
    const analysis::AnalysisSnapshot &snapshot) {
  return pool_->submit([this, request, snapshot] {
    return compute_recommendations(request, snapshot);
  });
}

std::future<RankingResult> RecommendationEngine::rank_recommendations(
    const std::vector<Recommendation> &recommendations,
    const std::map<std::string, std::string> &preferences,
    size_t max_recommendations) {
  return pool_->submit([this, recommendations, preferences,
                        max_recommendations] {
    return compute_ranking(recommendations, preferences, max_recommendations);
  });
}

std::future<ExplanationResult>
RecommendationEngine::explain_recommendation(const std::string &recommendation_id,
                                             const std::string &user_id) {
  return pool_->submit([this, recommendation_id, user_id] {
    return compute_explanation(recommendation_id, user_id);
  });
}

std::future<FeedbackResult>
RecommendationEngine::process_feedback(const RecommendationFeedback &feedback) {
  return pool_->submit([this, feedback] { return apply_feedback(feedback); });
}

std::future<RecommendationAccuracy>
RecommendationEngine::validate_accuracy(const std::string &recommendation_id) {
  return pool_->submit(
      [this, recommendation_id] { return compute_accuracy(recommendation_id); });
}

std::future<StatsResult>
RecommendationEngine::get_stats(const std::string &user_id,
                                const TimeRange &range) {
  return pool_->submit(
      [this, user_id, range] { return compute_stats(user_id, range); });
}

// --- Generation ---

RecommendationResponse RecommendationEngine::compute_recommendations(
    const RecommendationRequest &request,
    const analysis::AnalysisSnapshot &snapshot) {
  auto key = cache::CacheKeys::recommendation(request.user_id,
                                              context_hash(request));
  auto response = cache_->get_or_compute<RecommendationResponse>(
      cache::CacheOperation::RECOMMENDATION, key,
      [&] { return generate_uncached(request, snapshot); });

  // A cached response may predate this process or later feedback; the
  // ledger owns approval state
  std::vector<Recommendation> open;
  open.reserve(response.recommendations.size());
  for (auto &rec : response.recommendations) {
    ledger_.record(request.user_id, rec);
    auto entry = ledger_.find(rec.id);
    if (entry &&
        entry->recommendation.approval_status != ApprovalStatus::PENDING)
      continue;
    open.push_back(std::move(rec));
  }
  const bool dropped = open.size() != response.recommendations.size();
  response.recommendations = std::move(open);
  if (dropped) {
    double sum = 0.0;
    for (const auto &rec : response.recommendations)
      sum += rec.confidence;
    response.confidence = response.recommendations.empty()
                              ? 0.0
                              : sum / response.recommendations.size();
    response.stats = ledger_.stats_for_user(request.user_id, TimeRange{});
  }
  return response;
}

Recommendation RecommendationEngine::make_draft(
    const std::string &user_id, const std::string &title,
    const std::string &category, double confidence,
    const std::vector<std::string> &affected) const {
  Recommendation rec;
  rec.id = make_recommendation_id(user_id, title, affected);
  rec.title = title;
  rec.category = category;
  rec.confidence = std::clamp(confidence, 0.0, 1.0);
  rec.affected_subjects = affected;
  rec.estimated_impact = impact_for(category);
  rec.time_to_implement = effort_for(category);
  rec.approval_status = ApprovalStatus::PENDING;
  rec.created_at_ms = Utils::get_current_time_ms();
  rec.source = "analysis";
  return rec;
}

std::vector<Recommendation> RecommendationEngine::drafts_from_analysis(
    const RecommendationRequest &request,
    const analysis::AnalysisSnapshot &snapshot) const {
  std::vector<Recommendation> drafts;
  const auto &user = request.user_id;

  for (const auto &correlation : snapshot.correlations) {
    if (!correlation.success)
      continue;
    for (const auto &pair : correlation.strong_pairs) {
      bool positive = pair.coefficient >= 0.0;
      std::string title =
          positive ? "Automate " + pair.subject_a + " together with " +
                         pair.subject_b
                   : "Coordinate " + pair.subject_a + " and " + pair.subject_b;
      auto rec = make_draft(user, title, positive ? "automation" : "optimization",
                            std::abs(pair.coefficient) * pair.confidence,
                            {pair.subject_a, pair.subject_b});
      rec.description =
          positive ? "These devices are used together; a shared scene or "
                     "trigger would save manual steps."
                   : "These devices alternate; scheduling them apart avoids "
                     "overlapping load.";
      rec.explanation = pair.subject_a + " and " + pair.subject_b + " show a " +
                        pair.interpretation + " (r=" +
                        fixed2(pair.coefficient) + ").";
      drafts.push_back(std::move(rec));
    }
  }

  for (const auto &patterns : snapshot.patterns) {
    if (!patterns.success)
      continue;

    for (const auto &bp : patterns.behavioral_patterns) {
      if (bp.pattern_type != "daily_routine" &&
          bp.pattern_type != "household_routine")
        continue;
      if (bp.peak_hour < 0)
        continue;
      std::string title = "Schedule " + patterns.subject_id + " around " +
                          hour_label(bp.peak_hour);
      auto rec = make_draft(user, title, "automation",
                            bp.confidence * (0.5 + 0.5 * patterns.confidence),
                            {patterns.subject_id});
      rec.description = "A time-based automation can take over this routine.";
      rec.explanation = patterns.subject_id + " follows a daily routine (" +
                        bp.description + ") peaking around " +
                        hour_label(bp.peak_hour) + " in the " +
                        bp.time_of_day + ", routine strength " +
                        fixed2(bp.strength) + ".";
      drafts.push_back(std::move(rec));
    }

    if (!patterns.anomalies.empty()) {
      const analysis::Anomaly *worst = &patterns.anomalies.front();
      for (const auto &anomaly : patterns.anomalies) {
        if (anomaly.severity > worst->severity)
          worst = &anomaly;
      }
      std::string title = "Investigate unusual readings on " +
                          patterns.subject_id;
      auto rec = make_draft(user, title, "safety",
                            (0.5 + 0.5 * worst->severity) * patterns.confidence,
                            {patterns.subject_id});
      rec.description =
          "Readings left the usual hourly range; check the device and its "
          "automations.";
      rec.explanation = std::to_string(patterns.anomalies.size()) +
                        " anomalous readings on " + patterns.subject_id +
                        "; the largest was a " + worst->anomaly_type + " at " +
                        Utils::format_iso8601_ms(worst->timestamp_ms) +
                        " (z=" + fixed2(worst->z_score) + ").";
      drafts.push_back(std::move(rec));
    }
  }

  for (const auto &stats : snapshot.statistics) {
    if (!stats.success || stats.moving_averages.empty())
      continue;
    const auto &widest = *std::max_element(
        stats.moving_averages.begin(), stats.moving_averages.end(),
        [](const analysis::MovingAverage &a, const analysis::MovingAverage &b) {
          return a.window_size < b.window_size;
        });
    if (widest.trend_direction != "up" || widest.values.empty())
      continue;
    std::string title = "Review rising usage of " + stats.subject_id;
    auto rec = make_draft(user, title, "energy", 0.8 * stats.confidence,
                          {stats.subject_id});
    rec.description =
        "Consumption is climbing; a schedule or threshold alert can contain it.";
    rec.explanation = "The " + std::to_string(widest.window_size) +
                      "-sample moving average of " + stats.subject_id +
                      " rose from " + fixed2(widest.values.front().value) +
                      " to " + fixed2(widest.values.back().value) + ".";
    drafts.push_back(std::move(rec));
  }

  return drafts;
}

std::vector<Recommendation> RecommendationEngine::drafts_from_suggestions(
    const RecommendationRequest &request,
    const analysis::AnalysisSnapshot &snapshot,
    size_t max_recommendations) const {
  std::vector<Recommendation> drafts;
  if (!suggestions_)
    return drafts;
  if (Utils::to_lower_copy(request.privacy_level) == "local_only") {
    LOG(LogLevel::DEBUG, LogComponent::RECO_GENERATE,
        "Skipping external suggestions for local_only request of "
            << request.user_id);
    return drafts;
  }

  std::vector<SuggestionDraft> candidates;
  try {
    candidates = suggestions_->generate(request.context, max_recommendations);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::RECO_GENERATE,
        "Suggestion generator failed, continuing with analysis drafts: "
            << e.what());
    return drafts;
  }

  for (const auto &candidate : candidates) {
    // Evidence: mean pattern confidence of the affected subjects we analysed
    double evidence_sum = 0.0;
    size_t evidence_count = 0;
    for (const auto &patterns : snapshot.patterns) {
      if (!patterns.success)
        continue;
      if (std::find(candidate.affected_subjects.begin(),
                    candidate.affected_subjects.end(),
                    patterns.subject_id) != candidate.affected_subjects.end()) {
        evidence_sum += patterns.confidence;
        evidence_count++;
      }
    }
    double evidence = evidence_count > 0 ? evidence_sum / evidence_count : 0.0;
    double validated = std::min(std::clamp(candidate.claimed_confidence, 0.0, 1.0),
                                0.5 + 0.5 * evidence);

    std::string category = Utils::to_lower_copy(candidate.category);
    if (!CATEGORIES.count(category)) {
      LOG(LogLevel::WARN, LogComponent::RECO_GENERATE,
          "Suggestion '" << candidate.title << "' has unknown category '"
                         << candidate.category << "', filing as automation");
      category = "automation";
    }

    auto rec = make_draft(request.user_id, candidate.title, category, validated,
                          candidate.affected_subjects);
    rec.source = "suggestion";
    rec.description = candidate.description;
    if (!candidate.estimated_impact.empty())
      rec.estimated_impact = candidate.estimated_impact;
    if (!candidate.time_to_implement.empty())
      rec.time_to_implement = candidate.time_to_implement;
    rec.explanation =
        "Suggested for " +
        (candidate.affected_subjects.empty()
             ? std::string("the household")
             : join(candidate.affected_subjects, ", ")) +
        "; confidence " + fixed2(candidate.claimed_confidence) +
        " checked against analysis evidence " + fixed2(evidence) + ".";
    drafts.push_back(std::move(rec));
  }
  return drafts;
}

RecommendationResponse
RecommendationEngine::generate_uncached(const RecommendationRequest &request,
                                        const analysis::AnalysisSnapshot &snapshot) {
  ScopedTimer timer(
      MetricsRegistry::instance().operation_duration("recommendation"));
  RecommendationResponse response;
  response.user_id = request.user_id;
  response.generated_at_ms = Utils::get_current_time_ms();
  response.model_label = config_->recommendation.model_label;
  response.privacy_level = request.privacy_level;
  response.requires_approval = true;
  response.request_id =
      "req-" + Utils::hash_to_hex(Utils::stable_hash(
                   {request.user_id, context_hash(request),
                    std::to_string(response.generated_at_ms)}));

  try {
    const size_t max = effective_max(request.max_recommendations);
    auto drafts = drafts_from_analysis(request, snapshot);
    auto suggested = drafts_from_suggestions(request, snapshot, max);
    drafts.insert(drafts.end(), std::make_move_iterator(suggested.begin()),
                  std::make_move_iterator(suggested.end()));

    // First-seen order is kept so equal confidences rank in input order
    std::vector<Recommendation> candidates;
    std::map<std::string, size_t> index_by_id;
    for (auto &draft : drafts) {
      if (!request.type_filter.empty() &&
          std::find(request.type_filter.begin(), request.type_filter.end(),
                    draft.category) == request.type_filter.end())
        continue;

      // Already decided by the user; do not propose it again
      if (auto existing = ledger_.find(draft.id)) {
        if (existing->recommendation.approval_status != ApprovalStatus::PENDING)
          continue;
      }

      // Past ratings of the category shape new drafts only
      draft.confidence = std::clamp(
          draft.confidence * ledger_.category_factor(draft.category), 0.0, 1.0);

      auto it = index_by_id.find(draft.id);
      if (it == index_by_id.end()) {
        index_by_id.emplace(draft.id, candidates.size());
        candidates.push_back(std::move(draft));
      } else if (candidates[it->second].confidence < draft.confidence) {
        candidates[it->second] = std::move(draft);
      }
    }

    response.recommendations = rank(std::move(candidates), request.preferences, max);
    for (const auto &rec : response.recommendations)
      ledger_.record(request.user_id, rec);

    double sum = 0.0;
    for (const auto &rec : response.recommendations)
      sum += rec.confidence;
    response.confidence = response.recommendations.empty()
                              ? 0.0
                              : sum / response.recommendations.size();
    response.stats = ledger_.stats_for_user(request.user_id, TimeRange{});
    invalidate_user_stats(request.user_id);

    LOG(LogLevel::INFO, LogComponent::RECO_GENERATE,
        "Generated " << response.recommendations.size()
                     << " recommendations for " << request.user_id << " from "
                     << drafts.size() << " drafts");
  } catch (const std::exception &e) {
    fail_operation("recommendation", LogComponent::RECO_GENERATE, e.what());
    response.success = false;
    response.error_message = e.what();
    response.recommendations.clear();
    response.confidence = 0.0;
  }

  response.processing_time_ms = timer.elapsed_ms();
  return response;
}

// --- Ranking ---

std::vector<Recommendation>
RecommendationEngine::rank(std::vector<Recommendation> recommendations,
                           const std::map<std::string, std::string> &preferences,
                           size_t max_recommendations) const {
  auto min_it = preferences.find("min_confidence");
  if (min_it != preferences.end()) {
    if (auto floor = Utils::string_to_number<double>(min_it->second)) {
      recommendations.erase(
          std::remove_if(recommendations.begin(), recommendations.end(),
                         [&](const Recommendation &r) {
                           return r.confidence < *floor;
                         }),
          recommendations.end());
    } else {
      LOG(LogLevel::WARN, LogComponent::RECO_RANK,
          "Ignoring non-numeric min_confidence '" << min_it->second << "'");
    }
  }

  // Equal confidences keep their input order
  std::stable_sort(recommendations.begin(), recommendations.end(),
                   [](const Recommendation &a, const Recommendation &b) {
                     return a.confidence > b.confidence;
                   });
  if (recommendations.size() > max_recommendations)
    recommendations.resize(max_recommendations);
  return recommendations;
}

RankingResult RecommendationEngine::compute_ranking(
    const std::vector<Recommendation> &recommendations,
    const std::map<std::string, std::string> &preferences,
    size_t max_recommendations) {
  std::vector<std::string> list_parts;
  list_parts.reserve(recommendations.size() + 1);
  for (const auto &rec : recommendations)
    list_parts.push_back(rec.id + "@" + fixed2(rec.confidence));
  list_parts.push_back(std::to_string(effective_max(max_recommendations)));

  std::vector<std::string> pref_parts;
  for (const auto &[key, value] : preferences)
    pref_parts.push_back(key + "=" + value);

  auto key = cache::CacheKeys::ranking(
      Utils::hash_to_hex(Utils::stable_hash(list_parts)),
      Utils::hash_to_hex(Utils::stable_hash(pref_parts)));

  return cache_->get_or_compute<RankingResult>(
      cache::CacheOperation::RANKING, key, [&] {
        ScopedTimer timer(
            MetricsRegistry::instance().operation_duration("ranking"));
        RankingResult result;
        try {
          result.recommendations = rank(recommendations, preferences,
                                        effective_max(max_recommendations));
          LOG(LogLevel::DEBUG, LogComponent::RECO_RANK,
              "Ranked " << recommendations.size() << " recommendations, kept "
                        << result.recommendations.size());
        } catch (const std::exception &e) {
          fail_operation("ranking", LogComponent::RECO_RANK, e.what());
          result.success = false;
          result.error_message = e.what();
          result.recommendations.clear();
        }
        return result;
      });
}

// --- Explanation ---

ExplanationResult
RecommendationEngine::compute_explanation(const std::string &recommendation_id,
                                          const std::string &user_id) {
  return cache_->get_or_compute<ExplanationResult>(
      cache::CacheOperation::EXPLANATION,
      cache::CacheKeys::explanation(recommendation_id, user_id), [&] {
        ExplanationResult result;
        result.recommendation_id = recommendation_id;
        result.user_id = user_id;

        auto entry = ledger_.find(recommendation_id);
        if (!entry) {
          result.success = false;
          result.error_message = "unknown recommendation: " + recommendation_id;
          LOG(LogLevel::WARN, LogComponent::RECO_GENERATE, result.error_message);
          return result;
        }
        if (entry->user_id != user_id) {
          result.success = false;
          result.error_message = "recommendation " + recommendation_id +
                                 " was not issued to " + user_id;
          LOG(LogLevel::WARN, LogComponent::RECO_GENERATE, result.error_message);
          return result;
        }

        const auto &rec = entry->recommendation;
        result.explanation = rec.explanation;
        for (const auto &subject : rec.affected_subjects)
          result.evidence.push_back("affects " + subject);
        result.evidence.push_back("category " + rec.category);
        result.evidence.push_back("confidence " + fixed2(rec.confidence));
        result.evidence.push_back("source " + rec.source);
        return result;
      });
}

// --- Feedback and accuracy ---

void RecommendationEngine::invalidate_user_stats(const std::string &user_id) {
  cache_->invalidate_prefix("stats:" + user_id + ":");
}

void RecommendationEngine::invalidate_user_results(const std::string &user_id) {
  invalidate_user_stats(user_id);
  cache_->invalidate_prefix("recommendation:" + user_id + ":");
}

FeedbackResult
RecommendationEngine::apply_feedback(const RecommendationFeedback &feedback) {
  ScopedTimer timer(MetricsRegistry::instance().operation_duration("feedback"));
  FeedbackResult result;
  result.recommendation_id = feedback.recommendation_id;

  try {
    auto outcome = ledger_.apply_feedback(feedback);
    result.status = outcome.status;
    if (!outcome.applied) {
      result.success = false;
      result.error_message = outcome.error_message;
      LOG(LogLevel::WARN, LogComponent::RECO_FEEDBACK,
          "Rejected " << feedback_type_to_string(feedback.feedback_type)
                      << " feedback for " << feedback.recommendation_id << ": "
                      << outcome.error_message);
      return result;
    }

    MetricsRegistry::instance()
        .feedback_event(feedback_type_to_string(feedback.feedback_type))
        .Increment();
    invalidate_user_results(feedback.user_id);
    if (auto entry = ledger_.find(feedback.recommendation_id)) {
      if (entry->user_id != feedback.user_id)
        invalidate_user_results(entry->user_id);
    }
    LOG(LogLevel::INFO, LogComponent::RECO_FEEDBACK,
        "Recorded " << feedback_type_to_string(feedback.feedback_type)
                    << " for " << feedback.recommendation_id << ", status now "
                    << approval_status_to_string(result.status));
  } catch (const std::exception &e) {
    fail_operation("feedback", LogComponent::RECO_FEEDBACK, e.what());
    result.success = false;
    result.error_message = e.what();
  }
  return result;
}

RecommendationAccuracy
RecommendationEngine::compute_accuracy(const std::string &recommendation_id) {
  ScopedTimer timer(MetricsRegistry::instance().operation_duration("accuracy"));
  RecommendationAccuracy accuracy;
  accuracy.recommendation_id = recommendation_id;

  try {
    auto entry = ledger_.find(recommendation_id);
    if (!entry) {
      accuracy.success = false;
      accuracy.error_message = "unknown recommendation: " + recommendation_id;
      accuracy.processing_time_ms = timer.elapsed_ms();
      return accuracy;
    }

    const auto &rec = entry->recommendation;
    std::optional<double> outcome_score;
    switch (rec.approval_status) {
    case ApprovalStatus::IMPLEMENTED:
      outcome_score = 1.0;
      break;
    case ApprovalStatus::APPROVED:
      outcome_score = 0.8;
      break;
    case ApprovalStatus::ROLLED_BACK:
      outcome_score = 0.2;
      break;
    case ApprovalStatus::REJECTED:
      outcome_score = 0.0;
      break;
    case ApprovalStatus::PENDING:
      break;
    }

    std::optional<double> rating_score;
    double average_rating = 0.0;
    if (!entry->ratings.empty()) {
      for (int r : entry->ratings)
        average_rating += r;
      average_rating /= entry->ratings.size();
      rating_score = (average_rating - 1.0) / 4.0;
    }

    if (!outcome_score && !rating_score) {
      // Nothing recorded yet: fall back to the issued confidence
      accuracy.accuracy_score = rec.confidence;
      accuracy.confidence_score = 0.2;
      accuracy.validation_method = "prior_confidence";
    } else {
      double sum = 0.0;
      size_t parts = 0;
      if (outcome_score) {
        sum += *outcome_score;
        parts++;
      }
      if (rating_score) {
        sum += *rating_score;
        parts++;
      }
      accuracy.accuracy_score = sum / parts;
      accuracy.confidence_score =
          std::min(1.0, 0.4 + 0.2 * static_cast<double>(entry->history.size()));
      accuracy.validation_method = "recorded_outcomes";
    }

    const auto &thresholds = config_->recommendation;
    if (accuracy.accuracy_score >= thresholds.high_accuracy_threshold)
      accuracy.accuracy_level = "high";
    else if (accuracy.accuracy_score >= thresholds.medium_accuracy_threshold)
      accuracy.accuracy_level = "medium";
    else
      accuracy.accuracy_level = "low";

    if (outcome_score)
      accuracy.metrics.push_back(
          {"outcome_score", *outcome_score, 0.5, *outcome_score >= 0.5});
    if (rating_score)
      accuracy.metrics.push_back(
          {"average_rating", average_rating, 3.0, average_rating >= 3.0});
    double calibration = std::abs(rec.confidence - accuracy.accuracy_score);
    accuracy.metrics.push_back(
        {"calibration_error", calibration, 0.3, calibration <= 0.3});
  } catch (const std::exception &e) {
    fail_operation("accuracy", LogComponent::RECO_FEEDBACK, e.what());
    accuracy.success = false;
    accuracy.error_message = e.what();
    accuracy.metrics.clear();
  }

  accuracy.processing_time_ms = timer.elapsed_ms();
  return accuracy;
}

StatsResult RecommendationEngine::compute_stats(const std::string &user_id,
                                                const TimeRange &range) {
  return cache_->get_or_compute<StatsResult>(
      cache::CacheOperation::STATS, cache::CacheKeys::stats(user_id, range.to_key()),
      [&] {
        StatsResult result;
        result.user_id = user_id;
        try {
          result.stats = ledger_.stats_for_user(user_id, range);
        } catch (const std::exception &e) {
          fail_operation("stats", LogComponent::RECO_FEEDBACK, e.what());
          result.success = false;
          result.error_message = e.what();
        }
        return result;
      });
}

HealthStatus RecommendationEngine::health_status() const {
  HealthStatus status;
  status.component = "recommendation_engine";
  bool cache_ok = cache_->is_healthy();
  status.healthy = cache_ok;
  status.details["cache"] = cache_ok ? "up" : "down";
  status.details["suggestion_generator"] = suggestions_ ? "configured" : "none";
  status.details["ledger_entries"] = std::to_string(ledger_.size());
  status.details["model"] = config_->recommendation.model_label;
  return status;
}

} // namespace recommendation
