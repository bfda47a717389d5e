#include "correlation_engine.hpp"
#include "core/logger.hpp"
#include "statistical_engine.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace analysis {

double pearson_correlation(const std::vector<double> &a,
                           const std::vector<double> &b) {
  if (a.size() != b.size() || a.empty())
    return 0.0;

  double mean_a = stats::mean(a);
  double mean_b = stats::mean(b);
  double cov = 0.0, var_a = 0.0, var_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    double da = a[i] - mean_a;
    double db = b[i] - mean_b;
    cov += da * db;
    var_a += da * da;
    var_b += db * db;
  }
  if (var_a <= 0.0 || var_b <= 0.0)
    return 0.0;

  double r = cov / std::sqrt(var_a * var_b);
  return std::clamp(r, -1.0, 1.0);
}

CorrelationEngine::CorrelationEngine(Config::CorrelationConfig config)
    : config_(std::move(config)) {
  if (config_.weak_threshold > config_.strong_threshold)
    throw std::invalid_argument(
        "Weak correlation threshold must not exceed the strong threshold");
}

CorrelationPair CorrelationEngine::make_pair(const std::string &a,
                                             const std::string &b, double r,
                                             bool strong) const {
  CorrelationPair pair;
  pair.subject_a = a;
  pair.subject_b = b;
  pair.coefficient = r;
  pair.strength = strong ? "strong" : "weak";
  pair.direction = r >= 0.0 ? "positive" : "negative";
  pair.interpretation = std::string(strong ? "Strong " : "Weak ") +
                        pair.direction + " correlation";
  pair.confidence = strong ? 0.95 : 0.6;
  return pair;
}

CorrelationAnalysisResult CorrelationEngine::analyze(
    const std::map<std::string, std::vector<double>> &series,
    const TimeRange &range) const {
  CorrelationAnalysisResult result;
  result.range = range;
  result.analyzed_at_ms = Utils::get_current_time_ms();

  // std::map iteration is already lexicographic
  for (const auto &entry : series)
    result.subject_ids.push_back(entry.first);

  const size_t n = result.subject_ids.size();
  result.matrix.assign(n, std::vector<double>(n, 0.0));
  for (size_t i = 0; i < n; ++i) {
    result.matrix[i][i] = 1.0;
    for (size_t j = i + 1; j < n; ++j) {
      double r = pearson_correlation(series.at(result.subject_ids[i]),
                                     series.at(result.subject_ids[j]));
      result.matrix[i][j] = r;
      result.matrix[j][i] = r;
    }
  }

  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      double r = result.matrix[i][j];
      if (std::abs(r) > config_.strong_threshold)
        result.strong_pairs.push_back(make_pair(
            result.subject_ids[i], result.subject_ids[j], r, true));
      else if (std::abs(r) < config_.weak_threshold)
        result.weak_pairs.push_back(make_pair(
            result.subject_ids[i], result.subject_ids[j], r, false));
    }
  }

  result.clusters = cluster(result.subject_ids, result.matrix);
  result.confidence = n >= 2 ? 0.87 : 0.0;

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_CORRELATION,
      "Correlated " << n << " subjects: " << result.strong_pairs.size()
                    << " strong, " << result.weak_pairs.size() << " weak, "
                    << result.clusters.size() << " clusters");
  return result;
}

std::vector<CorrelationCluster>
CorrelationEngine::cluster(const std::vector<std::string> &subject_ids,
                           const std::vector<std::vector<double>> &matrix) const {
  std::vector<CorrelationCluster> clusters;
  const size_t n = subject_ids.size();

  // Visit in lexicographic order so the grouping is deterministic
  std::vector<size_t> order(n);
  for (size_t i = 0; i < n; ++i)
    order[i] = i;
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return subject_ids[a] < subject_ids[b];
  });

  std::vector<bool> visited(n, false);
  for (size_t seed : order) {
    if (visited[seed])
      continue;
    visited[seed] = true;
    std::vector<size_t> members{seed};

    for (size_t other : order) {
      if (visited[other])
        continue;
      if (std::abs(matrix[seed][other]) > config_.cluster_threshold) {
        visited[other] = true;
        members.push_back(other);
      }
    }
    if (members.size() < 2)
      continue;

    double sum = 0.0;
    size_t pairs = 0;
    for (size_t a : members) {
      for (size_t b : members) {
        if (a == b)
          continue;
        sum += matrix[a][b];
        ++pairs;
      }
    }

    CorrelationCluster c;
    for (size_t m : members)
      c.members.push_back(subject_ids[m]);
    c.average_correlation = pairs > 0 ? sum / pairs : 0.0;
    c.description =
        "Device cluster with " + std::to_string(members.size()) + " devices";
    clusters.push_back(std::move(c));
  }
  return clusters;
}

} // namespace analysis
