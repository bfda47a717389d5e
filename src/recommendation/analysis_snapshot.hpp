#ifndef ANALYSIS_SNAPSHOT_HPP
#define ANALYSIS_SNAPSHOT_HPP

#include "analysis/analysis_types.hpp"
#include "analysis/analytics_service.hpp"
#include "analysis/pattern_engine.hpp"
#include "recommendation_types.hpp"

namespace recommendation {

/**
 * Gathers the statistics, patterns, anomalies and correlations a request's
 * devices need. Devices default to the household's when the request lists
 * none. The analyses run in parallel on the worker pool and are awaited on
 * the calling thread, so this must not be called from a pool worker.
 */
analysis::AnalysisSnapshot
collect_analysis_snapshot(analysis::AnalyticsService &analytics,
                          analysis::PatternEngine &patterns,
                          const RecommendationRequest &request);

} // namespace recommendation

#endif // ANALYSIS_SNAPSHOT_HPP
