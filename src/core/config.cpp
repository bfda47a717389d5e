#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::to_upper_copy(Utils::trim_copy(level_str_raw));
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"cache", LogComponent::CACHE},
    {"ingest", LogComponent::INGEST},
    {"analysis.stats", LogComponent::ANALYSIS_STATS},
    {"analysis.frequency", LogComponent::ANALYSIS_FREQUENCY},
    {"analysis.correlation", LogComponent::ANALYSIS_CORRELATION},
    {"analysis.pattern", LogComponent::ANALYSIS_PATTERN},
    {"reco.generate", LogComponent::RECO_GENERATE},
    {"reco.rank", LogComponent::RECO_RANK},
    {"reco.feedback", LogComponent::RECO_FEEDBACK}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<size_t> string_to_size_list(const std::string &value,
                                        const std::vector<size_t> &fallback) {
  std::vector<size_t> result;
  for (const auto &token : Utils::split_string(value, ',')) {
    auto parsed = Utils::string_to_number<size_t>(Utils::trim_copy(token));
    if (!parsed || *parsed == 0)
      return fallback;
    result.push_back(*parsed);
  }
  return result.empty() ? fallback : result;
}

bool validate_cache_config(const CacheConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_entries < 100 || config.max_entries > 10000000) {
    errors.push_back("Cache max entries must be between 100 and 10000000");
    valid = false;
  }

  const std::vector<std::pair<const char *, uint32_t>> ttls = {
      {"time series", config.time_series_ttl_seconds},
      {"statistical", config.statistical_ttl_seconds},
      {"frequency", config.frequency_ttl_seconds},
      {"correlation", config.correlation_ttl_seconds},
      {"pattern", config.pattern_ttl_seconds},
      {"anomaly", config.anomaly_ttl_seconds},
      {"prediction", config.prediction_ttl_seconds},
      {"recommendation", config.recommendation_ttl_seconds},
      {"ranking", config.ranking_ttl_seconds},
      {"explanation", config.explanation_ttl_seconds},
      {"stats", config.stats_ttl_seconds}};

  for (const auto &[name, ttl] : ttls) {
    if (ttl < 1 || ttl > 604800) {
      errors.push_back(std::string("Cache ") + name +
                       " TTL must be between 1 and 604800 seconds");
      valid = false;
    }
  }

  // Time-sensitive results must never outlive the pattern results
  if (config.anomaly_ttl_seconds > config.pattern_ttl_seconds ||
      config.prediction_ttl_seconds > config.pattern_ttl_seconds) {
    errors.push_back(
        "Cache anomaly and prediction TTLs must not exceed the pattern TTL");
    valid = false;
  }

  return valid;
}

bool validate_statistics_config(const StatisticsConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.moving_average_windows.empty()) {
    errors.push_back("Statistics moving average windows must not be empty");
    valid = false;
  }

  for (size_t window : config.moving_average_windows) {
    if (window < 2 || window > 1000) {
      errors.push_back(
          "Statistics moving average windows must be between 2 and 1000");
      valid = false;
      break;
    }
  }

  if (config.seasonality_lag < 1 || config.seasonality_lag > 8760) {
    errors.push_back("Statistics seasonality lag must be between 1 and 8760");
    valid = false;
  }

  if (config.seasonality_threshold <= 0.0 ||
      config.seasonality_threshold >= 1.0) {
    errors.push_back(
        "Statistics seasonality threshold must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.cluster_count < 1 || config.cluster_count > 64) {
    errors.push_back("Statistics cluster count must be between 1 and 64");
    valid = false;
  }

  return valid;
}

bool validate_correlation_config(const CorrelationConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (config.strong_threshold <= 0.0 || config.strong_threshold > 1.0) {
    errors.push_back(
        "Correlation strong threshold must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.weak_threshold < 0.0 ||
      config.weak_threshold >= config.strong_threshold) {
    errors.push_back("Correlation weak threshold must be non-negative and "
                     "below the strong threshold");
    valid = false;
  }

  if (config.cluster_threshold <= 0.0 || config.cluster_threshold > 1.0) {
    errors.push_back(
        "Correlation cluster threshold must be between 0.0 and 1.0");
    valid = false;
  }

  return valid;
}

bool validate_pattern_config(const PatternConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.min_samples < 2 || config.min_samples > 100000) {
    errors.push_back("Pattern minimum samples must be between 2 and 100000");
    valid = false;
  }

  if (config.anomaly_z_threshold < 1.0 || config.anomaly_z_threshold > 10.0) {
    errors.push_back("Pattern anomaly z threshold must be between 1.0 and 10.0");
    valid = false;
  }

  if (config.prediction_horizon_steps < 1 ||
      config.prediction_horizon_steps > 168) {
    errors.push_back("Pattern prediction horizon must be between 1 and 168");
    valid = false;
  }

  if (config.ewma_alpha <= 0.0 || config.ewma_alpha > 1.0) {
    errors.push_back("Pattern EWMA alpha must be between 0.0 and 1.0");
    valid = false;
  }

  return valid;
}

bool validate_recommendation_config(const RecommendationConfig &config,
                                    std::vector<std::string> &errors) {
  bool valid = true;

  if (config.default_max_recommendations < 1 ||
      config.default_max_recommendations > 100) {
    errors.push_back(
        "Recommendation default max count must be between 1 and 100");
    valid = false;
  }

  if (config.medium_accuracy_threshold <= 0.0 ||
      config.medium_accuracy_threshold >= config.high_accuracy_threshold ||
      config.high_accuracy_threshold > 1.0) {
    errors.push_back("Recommendation accuracy thresholds must satisfy "
                     "0 < medium < high <= 1");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("Worker threads must be between 1 and 256");
    valid = false;
  }

  if (config.default_granularity != "15m" &&
      config.default_granularity != "1h" &&
      config.default_granularity != "1d") {
    errors.push_back("Default granularity must be one of 15m, 1h, 1d");
    valid = false;
  }

  if (config.default_lookback_hours < 1 ||
      config.default_lookback_hours > 8760) {
    errors.push_back("Default lookback must be between 1 and 8760 hours");
    valid = false;
  }

  valid &= validate_cache_config(config.cache, errors);
  valid &= validate_statistics_config(config.statistics, errors);
  valid &= validate_correlation_config(config.correlation, errors);
  valid &= validate_pattern_config(config.patterns, errors);
  valid &= validate_recommendation_config(config.recommendation, errors);

  return valid;
}

namespace {

template <typename T> void assign_number(const std::string &value, T &target) {
  target = Utils::string_to_number<T>(value).value_or(target);
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      if (current_section.empty()) {
        if (key == Keys::WORKER_THREADS)
          assign_number(value, config.worker_threads);
        else if (key == Keys::DEFAULT_GRANULARITY)
          config.default_granularity = value;
        else if (key == Keys::DEFAULT_LOOKBACK_HOURS)
          assign_number(value, config.default_lookback_hours);
        else if (key == Keys::DATA_SOURCE_LABEL)
          config.data_source_label = value;
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Cache") {
        auto &c = config.cache;
        if (key == Keys::CA_ENABLED)
          c.enabled = string_to_bool(value);
        else if (key == Keys::CA_MAX_ENTRIES)
          assign_number(value, c.max_entries);
        else if (key == Keys::CA_TIME_SERIES_TTL)
          assign_number(value, c.time_series_ttl_seconds);
        else if (key == Keys::CA_STATISTICAL_TTL)
          assign_number(value, c.statistical_ttl_seconds);
        else if (key == Keys::CA_FREQUENCY_TTL)
          assign_number(value, c.frequency_ttl_seconds);
        else if (key == Keys::CA_CORRELATION_TTL)
          assign_number(value, c.correlation_ttl_seconds);
        else if (key == Keys::CA_PATTERN_TTL)
          assign_number(value, c.pattern_ttl_seconds);
        else if (key == Keys::CA_ANOMALY_TTL)
          assign_number(value, c.anomaly_ttl_seconds);
        else if (key == Keys::CA_PREDICTION_TTL)
          assign_number(value, c.prediction_ttl_seconds);
        else if (key == Keys::CA_RECOMMENDATION_TTL)
          assign_number(value, c.recommendation_ttl_seconds);
        else if (key == Keys::CA_RANKING_TTL)
          assign_number(value, c.ranking_ttl_seconds);
        else if (key == Keys::CA_EXPLANATION_TTL)
          assign_number(value, c.explanation_ttl_seconds);
        else if (key == Keys::CA_STATS_TTL)
          assign_number(value, c.stats_ttl_seconds);

      } else if (current_section == "Statistics") {
        auto &s = config.statistics;
        if (key == Keys::ST_MOVING_AVERAGE_WINDOWS)
          s.moving_average_windows =
              string_to_size_list(value, s.moving_average_windows);
        else if (key == Keys::ST_SEASONALITY_LAG)
          assign_number(value, s.seasonality_lag);
        else if (key == Keys::ST_SEASONALITY_THRESHOLD)
          assign_number(value, s.seasonality_threshold);
        else if (key == Keys::ST_CLUSTER_COUNT)
          assign_number(value, s.cluster_count);

      } else if (current_section == "Frequency") {
        auto &f = config.frequency;
        if (key == Keys::FR_SAMPLING_RATE)
          assign_number(value, f.sampling_rate);
        else if (key == Keys::FR_DOMINANT_COUNT)
          assign_number(value, f.dominant_count);
        else if (key == Keys::FR_MATCH_TOLERANCE)
          assign_number(value, f.match_tolerance);

      } else if (current_section == "Correlation") {
        auto &c = config.correlation;
        if (key == Keys::CO_STRONG_THRESHOLD)
          assign_number(value, c.strong_threshold);
        else if (key == Keys::CO_WEAK_THRESHOLD)
          assign_number(value, c.weak_threshold);
        else if (key == Keys::CO_CLUSTER_THRESHOLD)
          assign_number(value, c.cluster_threshold);

      } else if (current_section == "Patterns") {
        auto &p = config.patterns;
        if (key == Keys::PA_MIN_SAMPLES)
          assign_number(value, p.min_samples);
        else if (key == Keys::PA_ANOMALY_Z_THRESHOLD)
          assign_number(value, p.anomaly_z_threshold);
        else if (key == Keys::PA_PREDICTION_HORIZON)
          assign_number(value, p.prediction_horizon_steps);
        else if (key == Keys::PA_EWMA_ALPHA)
          assign_number(value, p.ewma_alpha);
        else if (key == Keys::PA_PRIVACY_LEVEL)
          p.privacy_level = value;

      } else if (current_section == "Recommendation") {
        auto &r = config.recommendation;
        if (key == Keys::RE_DEFAULT_MAX)
          assign_number(value, r.default_max_recommendations);
        else if (key == Keys::RE_HIGH_ACCURACY)
          assign_number(value, r.high_accuracy_threshold);
        else if (key == Keys::RE_MEDIUM_ACCURACY)
          assign_number(value, r.medium_accuracy_threshold);
        else if (key == Keys::RE_MODEL_LABEL)
          r.model_label = value;

      } else if (current_section == "Metrics") {
        if (key == Keys::ME_ENABLED)
          config.metrics.enabled = string_to_bool(value);

      } else if (current_section == "Logging") {
        if (key == "default_level") {
          LogLevel level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = level;
        } else {
          auto it = key_to_component_map.find(key);
          if (it != key_to_component_map.end())
            config.logging.log_levels[it->second] = string_to_log_level(value);
          else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
        }
      }
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Failed to parse value for key '" << key
                << "': " << e.what() << std::endl;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
