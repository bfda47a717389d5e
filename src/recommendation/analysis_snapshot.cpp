#include "analysis_snapshot.hpp"
#include "core/logger.hpp"

#include <future>
#include <vector>

namespace recommendation {

analysis::AnalysisSnapshot
collect_analysis_snapshot(analysis::AnalyticsService &analytics,
                          analysis::PatternEngine &patterns,
                          const RecommendationRequest &request) {
  analysis::AnalysisSnapshot snapshot;
  std::vector<std::string> devices = request.device_ids;

  if (!request.household_id.empty()) {
    auto household = patterns.analyze_household_patterns(request.household_id);
    if (devices.empty()) {
      auto model = patterns.build_behavioral_model(request.household_id).get();
      for (const auto &usage : model.device_usage)
        devices.push_back(usage.device_id);
    }
    snapshot.patterns.push_back(household.get());
  }

  std::vector<std::future<analysis::StatisticalAnalysisResult>> stats;
  std::vector<std::future<analysis::PatternAnalysisResult>> device_patterns;
  std::vector<std::future<analysis::PatternAnalysisResult>> anomalies;
  for (const auto &device : devices) {
    stats.push_back(analytics.analyze_statistics(device));
    device_patterns.push_back(patterns.analyze_device_patterns(device));
    anomalies.push_back(patterns.detect_anomalies(device));
  }

  std::future<analysis::CorrelationAnalysisResult> correlation;
  if (devices.size() >= 2) {
    TimeRange range =
        request.range.end_ms != 0 ? request.range : analytics.lookback_range();
    correlation = analytics.analyze_correlation(devices, range);
  }

  for (auto &f : stats)
    snapshot.statistics.push_back(f.get());
  for (auto &f : device_patterns)
    snapshot.patterns.push_back(f.get());
  for (auto &f : anomalies)
    snapshot.patterns.push_back(f.get());
  if (correlation.valid())
    snapshot.correlations.push_back(correlation.get());

  LOG(LogLevel::DEBUG, LogComponent::RECO_GENERATE,
      "Collected analysis snapshot for " << request.user_id << ": "
                                         << devices.size() << " devices, "
                                         << snapshot.patterns.size()
                                         << " pattern results");
  return snapshot;
}

} // namespace recommendation
