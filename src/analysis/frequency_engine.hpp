#ifndef FREQUENCY_ENGINE_HPP
#define FREQUENCY_ENGINE_HPP

#include "analysis_types.hpp"
#include "core/config.hpp"

#include <string>
#include <vector>

namespace analysis {

// Spectral decomposition of one subject's series. Frequencies are in cycles
// per hour: bin k maps to k * sampling_rate / N.
class FrequencyEngine {
public:
  explicit FrequencyEngine(Config::FrequencyConfig config);

  FrequencyAnalysisResult analyze(const std::string &subject_id,
                                  const std::vector<double> &values) const;

  static std::string interpret_frequency(double frequency);
  static std::string period_label(double frequency);

private:
  std::vector<DominantFrequency>
  dominant_frequencies(const std::vector<FrequencyComponent> &components,
                       double total_power) const;
  std::vector<PeriodicPattern>
  periodic_patterns(const std::vector<FrequencyComponent> &components,
                    double total_power) const;

  Config::FrequencyConfig config_;
};

} // namespace analysis

#endif // FREQUENCY_ENGINE_HPP
