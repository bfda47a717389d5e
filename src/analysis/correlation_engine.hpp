#ifndef CORRELATION_ENGINE_HPP
#define CORRELATION_ENGINE_HPP

#include "analysis_types.hpp"
#include "core/config.hpp"

#include <map>
#include <string>
#include <vector>

namespace analysis {

// Pearson r; 0 for mismatched lengths, empty input or zero variance
double pearson_correlation(const std::vector<double> &a,
                           const std::vector<double> &b);

class CorrelationEngine {
public:
  explicit CorrelationEngine(Config::CorrelationConfig config);

  /**
   * Builds the symmetric matrix over the subjects in lexicographic order,
   * classifies each unordered pair once and groups subjects greedily.
   */
  CorrelationAnalysisResult
  analyze(const std::map<std::string, std::vector<double>> &series,
          const TimeRange &range) const;

  std::vector<CorrelationCluster>
  cluster(const std::vector<std::string> &subject_ids,
          const std::vector<std::vector<double>> &matrix) const;

private:
  CorrelationPair make_pair(const std::string &a, const std::string &b,
                            double r, bool strong) const;

  Config::CorrelationConfig config_;
};

} // namespace analysis

#endif // CORRELATION_ENGINE_HPP
