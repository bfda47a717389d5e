#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *DEFAULT_GRANULARITY = "default_granularity";
constexpr const char *DEFAULT_LOOKBACK_HOURS = "default_lookback_hours";
constexpr const char *DATA_SOURCE_LABEL = "data_source_label";

// Cache Settings
constexpr const char *CA_ENABLED = "enabled";
constexpr const char *CA_MAX_ENTRIES = "max_entries";
constexpr const char *CA_TIME_SERIES_TTL = "time_series_ttl_seconds";
constexpr const char *CA_STATISTICAL_TTL = "statistical_ttl_seconds";
constexpr const char *CA_FREQUENCY_TTL = "frequency_ttl_seconds";
constexpr const char *CA_CORRELATION_TTL = "correlation_ttl_seconds";
constexpr const char *CA_PATTERN_TTL = "pattern_ttl_seconds";
constexpr const char *CA_ANOMALY_TTL = "anomaly_ttl_seconds";
constexpr const char *CA_PREDICTION_TTL = "prediction_ttl_seconds";
constexpr const char *CA_RECOMMENDATION_TTL = "recommendation_ttl_seconds";
constexpr const char *CA_RANKING_TTL = "ranking_ttl_seconds";
constexpr const char *CA_EXPLANATION_TTL = "explanation_ttl_seconds";
constexpr const char *CA_STATS_TTL = "stats_ttl_seconds";

// Statistics Settings
constexpr const char *ST_MOVING_AVERAGE_WINDOWS = "moving_average_windows";
constexpr const char *ST_SEASONALITY_LAG = "seasonality_lag";
constexpr const char *ST_SEASONALITY_THRESHOLD = "seasonality_threshold";
constexpr const char *ST_CLUSTER_COUNT = "cluster_count";

// Frequency Settings
constexpr const char *FR_SAMPLING_RATE = "sampling_rate";
constexpr const char *FR_DOMINANT_COUNT = "dominant_count";
constexpr const char *FR_MATCH_TOLERANCE = "match_tolerance";

// Correlation Settings
constexpr const char *CO_STRONG_THRESHOLD = "strong_threshold";
constexpr const char *CO_WEAK_THRESHOLD = "weak_threshold";
constexpr const char *CO_CLUSTER_THRESHOLD = "cluster_threshold";

// Pattern Settings
constexpr const char *PA_MIN_SAMPLES = "min_samples";
constexpr const char *PA_ANOMALY_Z_THRESHOLD = "anomaly_z_threshold";
constexpr const char *PA_PREDICTION_HORIZON = "prediction_horizon_steps";
constexpr const char *PA_EWMA_ALPHA = "ewma_alpha";
constexpr const char *PA_PRIVACY_LEVEL = "privacy_level";

// Recommendation Settings
constexpr const char *RE_DEFAULT_MAX = "default_max_recommendations";
constexpr const char *RE_HIGH_ACCURACY = "high_accuracy_threshold";
constexpr const char *RE_MEDIUM_ACCURACY = "medium_accuracy_threshold";
constexpr const char *RE_MODEL_LABEL = "model_label";

// Metrics Settings
constexpr const char *ME_ENABLED = "enabled";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct CacheConfig {
  bool enabled = true;
  size_t max_entries = 50000;
  uint32_t time_series_ttl_seconds = 3600;    // 1 hour
  uint32_t statistical_ttl_seconds = 86400;   // 24 hours
  uint32_t frequency_ttl_seconds = 43200;     // 12 hours
  uint32_t correlation_ttl_seconds = 21600;   // 6 hours
  uint32_t pattern_ttl_seconds = 86400;       // 24 hours
  uint32_t anomaly_ttl_seconds = 3600;        // 1 hour
  uint32_t prediction_ttl_seconds = 1800;     // 30 minutes
  uint32_t recommendation_ttl_seconds = 1800; // 30 minutes
  uint32_t ranking_ttl_seconds = 900;         // 15 minutes
  uint32_t explanation_ttl_seconds = 3600;    // 1 hour
  uint32_t stats_ttl_seconds = 86400;         // 24 hours
};

struct StatisticsConfig {
  std::vector<size_t> moving_average_windows = {5, 10, 20};
  size_t seasonality_lag = 24;
  double seasonality_threshold = 0.3;
  size_t cluster_count = 3;
};

struct FrequencyConfig {
  double sampling_rate = 1.0; // samples per hour
  size_t dominant_count = 5;
  double match_tolerance = 0.001;
};

struct CorrelationConfig {
  double strong_threshold = 0.7;
  double weak_threshold = 0.3;
  double cluster_threshold = 0.6;
};

struct PatternConfig {
  size_t min_samples = 48;
  double anomaly_z_threshold = 3.0;
  size_t prediction_horizon_steps = 6;
  double ewma_alpha = 0.3;
  std::string privacy_level = "LOCAL_ONLY";
};

struct RecommendationConfig {
  size_t default_max_recommendations = 5;
  double high_accuracy_threshold = 0.8;
  double medium_accuracy_threshold = 0.5;
  std::string model_label = "analysis_ranked_v1";
};

struct MetricsConfig {
  bool enabled = true;
};

struct AppConfig {
  size_t worker_threads = 4;
  std::string default_granularity = "1h";
  uint32_t default_lookback_hours = 168; // 1 week
  std::string data_source_label = "csv";

  CacheConfig cache;
  StatisticsConfig statistics;
  FrequencyConfig frequency;
  CorrelationConfig correlation;
  PatternConfig patterns;
  RecommendationConfig recommendation;
  MetricsConfig metrics;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_cache_config(const CacheConfig &config,
                           std::vector<std::string> &errors);
bool validate_statistics_config(const StatisticsConfig &config,
                                std::vector<std::string> &errors);
bool validate_correlation_config(const CorrelationConfig &config,
                                 std::vector<std::string> &errors);
bool validate_pattern_config(const PatternConfig &config,
                             std::vector<std::string> &errors);
bool validate_recommendation_config(const RecommendationConfig &config,
                                    std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
