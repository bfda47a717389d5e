#include "analysis/analytics_service.hpp"
#include "analysis/pattern_engine.hpp"
#include "analysis/series_provider.hpp"
#include "cache/in_memory_cache_backend.hpp"
#include "cache/result_cache.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "ingest/csv_time_series_source.hpp"
#include "recommendation/analysis_snapshot.hpp"
#include "recommendation/recommendation_engine.hpp"
#include "utils/json_formatter.hpp"
#include "utils/worker_pool.hpp"

#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct CliOptions {
  std::string config_path;
  std::string series_path;
  std::string user_id;
  std::string household_id;
  bool print_metrics = false;
};

void print_usage(const char *program) {
  std::cerr << "Usage: " << program
            << " <config.ini> <series.csv> [--user <id>] [--household <id>]"
               " [--metrics]\n";
}

bool parse_arguments(int argc, char *argv[], CliOptions &options) {
  if (argc < 3)
    return false;
  options.config_path = argv[1];
  options.series_path = argv[2];
  for (int i = 3; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--user" && i + 1 < argc) {
      options.user_id = argv[++i];
    } else if (arg == "--household" && i + 1 < argc) {
      options.household_id = argv[++i];
    } else if (arg == "--metrics") {
      options.print_metrics = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

nlohmann::json health_to_json(const HealthStatus &status) {
  return nlohmann::json{{"component", status.component},
                        {"healthy", status.healthy},
                        {"details", status.details}};
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  CliOptions options;
  if (!parse_arguments(argc, argv, options)) {
    print_usage(argv[0]);
    return 2;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(options.config_path))
    std::cerr << "Continuing with default configuration.\n";
  auto config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "HomeSense analytics starting up...");

  // --- Wire Components ---
  std::shared_ptr<ingest::CsvTimeSeriesSource> source;
  try {
    source = std::make_shared<ingest::CsvTimeSeriesSource>(
        options.series_path, config->data_source_label);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // Analyses look back from the newest sample rather than from wall time
  const uint64_t anchor_ms = source->full_range().end_ms + 1;
  auto clock = [anchor_ms] { return anchor_ms; };

  std::shared_ptr<WorkerPool> pool;
  std::shared_ptr<cache::ResultCache> result_cache;
  try {
    pool = std::make_shared<WorkerPool>(config->worker_threads);
    auto backend = std::make_shared<cache::InMemoryCacheBackend>(
        config->cache.max_entries);
    result_cache = std::make_shared<cache::ResultCache>(backend, config->cache);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to initialize core components: " << e.what());
    return 1;
  }

  auto series = std::make_shared<analysis::SeriesProvider>(source, result_cache);
  analysis::AnalyticsService analytics(series, result_cache, pool, config, clock);
  analysis::PatternEngine patterns(series, result_cache, pool, config, clock);
  recommendation::RecommendationEngine recommendations(result_cache, pool,
                                                       config);

  // --- Run Analyses ---
  const auto subjects = source->subjects();
  const TimeRange lookback = analytics.lookback_range();
  const std::vector<std::string> intervals = {"1d", "1w"};

  struct SubjectFutures {
    std::future<analysis::StatisticalAnalysisResult> statistics;
    std::future<analysis::FrequencyAnalysisResult> frequency;
    std::future<analysis::PatternAnalysisResult> device_patterns;
    std::future<analysis::PatternAnalysisResult> anomalies;
    std::future<analysis::PatternAnalysisResult> predictions;
  };
  std::vector<SubjectFutures> pending;
  pending.reserve(subjects.size());
  for (const auto &subject : subjects) {
    pending.push_back({analytics.analyze_statistics(subject),
                       analytics.analyze_frequency(subject, lookback),
                       patterns.analyze_device_patterns(subject, intervals),
                       patterns.detect_anomalies(subject),
                       patterns.generate_predictions(subject)});
  }
  auto correlation = analytics.analyze_correlation(subjects, lookback);

  nlohmann::json output;
  output["source"] = {{"file", options.series_path},
                      {"rows_loaded", source->rows_loaded()},
                      {"rows_rejected", source->rows_rejected()},
                      {"range", source->full_range()}};

  nlohmann::json per_subject = nlohmann::json::object();
  for (size_t i = 0; i < subjects.size(); ++i) {
    auto &f = pending[i];
    per_subject[subjects[i]] = {{"statistics", f.statistics.get()},
                                {"frequency", f.frequency.get()},
                                {"patterns", f.device_patterns.get()},
                                {"anomalies", f.anomalies.get()},
                                {"predictions", f.predictions.get()}};
  }
  output["subjects"] = std::move(per_subject);
  output["correlation"] = correlation.get();

  nlohmann::json households = nlohmann::json::object();
  for (const auto &household : source->households()) {
    households[household] = {
        {"patterns", patterns.analyze_household_patterns(household).get()},
        {"model", patterns.build_behavioral_model(household).get()}};
  }
  output["households"] = std::move(households);

  if (!options.user_id.empty()) {
    recommendation::RecommendationRequest request;
    request.user_id = options.user_id;
    request.household_id = options.household_id;
    request.context = "cli";
    if (options.household_id.empty())
      request.device_ids = subjects;
    request.privacy_level = config->patterns.privacy_level;
    request.range = lookback;

    auto snapshot =
        recommendation::collect_analysis_snapshot(analytics, patterns, request);
    output["recommendations"] =
        recommendations.generate_recommendations(request, snapshot).get();
  }

  output["health"] = nlohmann::json::array(
      {health_to_json(analytics.health_status()),
       health_to_json(patterns.health_status()),
       health_to_json(recommendations.health_status())});

  std::cout << JsonFormatter::to_display_string(output) << std::endl;

  if (options.print_metrics && config->metrics.enabled)
    std::cerr << MetricsRegistry::instance().serialize_text();

  pool->shutdown();
  LOG(LogLevel::INFO, LogComponent::CORE, "HomeSense analytics finished.");
  return 0;
}
