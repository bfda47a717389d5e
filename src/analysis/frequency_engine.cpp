#include "frequency_engine.hpp"
#include "core/logger.hpp"
#include "fft.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <stdexcept>

namespace analysis {

namespace {
struct PeriodTarget {
  const char *name;
  double hours;
};

constexpr PeriodTarget PERIOD_TARGETS[] = {
    {"daily", 24.0}, {"weekly", 168.0}, {"monthly", 720.0}};
} // namespace

FrequencyEngine::FrequencyEngine(Config::FrequencyConfig config)
    : config_(std::move(config)) {
  if (config_.sampling_rate <= 0.0)
    throw std::invalid_argument("Sampling rate must be positive");
  if (config_.dominant_count == 0)
    throw std::invalid_argument("Dominant frequency count must be positive");
}

std::string FrequencyEngine::interpret_frequency(double frequency) {
  if (frequency < 0.01)
    return "very low frequency pattern";
  if (frequency < 0.1)
    return "low frequency pattern";
  if (frequency < 0.5)
    return "medium frequency pattern";
  return "high frequency pattern";
}

std::string FrequencyEngine::period_label(double frequency) {
  if (frequency <= 0.0)
    return "\xE2\x88\x9E"; // infinity sign
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2fh", 1.0 / frequency);
  return buffer;
}

FrequencyAnalysisResult
FrequencyEngine::analyze(const std::string &subject_id,
                         const std::vector<double> &values) const {
  FrequencyAnalysisResult result;
  result.subject_id = subject_id;
  result.sampling_rate = config_.sampling_rate;
  result.analyzed_at_ms = Utils::get_current_time_ms();

  if (values.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_FREQUENCY,
        "No samples for " << subject_id << ", skipping transform");
    return result;
  }

  auto spectrum = fft_forward(values);
  const size_t n = spectrum.size();
  result.fft_size = n;

  result.components.reserve(n / 2);
  for (size_t k = 0; k < n / 2; ++k) {
    FrequencyComponent component;
    component.frequency =
        static_cast<double>(k) * config_.sampling_rate / static_cast<double>(n);
    component.amplitude = std::abs(spectrum[k]);
    component.phase = std::arg(spectrum[k]);
    component.power = component.amplitude * component.amplitude;
    component.period_label = period_label(component.frequency);
    result.components.push_back(std::move(component));
  }

  double total_power = 0.0;
  for (const auto &c : result.components)
    total_power += c.power;

  result.dominant_frequencies =
      dominant_frequencies(result.components, total_power);
  result.periodic_patterns = periodic_patterns(result.components, total_power);
  result.confidence =
      0.85 * std::min(1.0, static_cast<double>(values.size()) / 48.0);

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_FREQUENCY,
      "FFT for " << subject_id << ": n=" << values.size() << " padded=" << n
                 << " patterns=" << result.periodic_patterns.size());
  return result;
}

std::vector<DominantFrequency> FrequencyEngine::dominant_frequencies(
    const std::vector<FrequencyComponent> &components,
    double total_power) const {
  std::vector<size_t> order(components.size());
  std::iota(order.begin(), order.end(), 0);
  // Ties keep the lower bin first
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return components[a].power > components[b].power;
  });

  std::vector<DominantFrequency> dominant;
  size_t count = std::min(config_.dominant_count, order.size());
  dominant.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const auto &c = components[order[i]];
    DominantFrequency d;
    d.frequency = c.frequency;
    d.amplitude = c.amplitude;
    d.period = c.frequency > 0.0 ? 1.0 / c.frequency : 0.0;
    d.significance = total_power > 0.0 ? c.power / total_power : 0.0;
    d.interpretation = interpret_frequency(c.frequency);
    dominant.push_back(std::move(d));
  }
  return dominant;
}

std::vector<PeriodicPattern> FrequencyEngine::periodic_patterns(
    const std::vector<FrequencyComponent> &components,
    double total_power) const {
  std::vector<PeriodicPattern> patterns;
  for (const auto &target : PERIOD_TARGETS) {
    const double target_frequency = 1.0 / target.hours;
    const FrequencyComponent *best = nullptr;
    for (const auto &c : components) {
      if (std::abs(c.frequency - target_frequency) >= config_.match_tolerance)
        continue;
      if (!best || c.power > best->power)
        best = &c;
    }
    if (!best)
      continue;

    PeriodicPattern pattern;
    pattern.pattern_type = target.name;
    pattern.period = best->frequency > 0.0 ? 1.0 / best->frequency : 0.0;
    pattern.strength = total_power > 0.0 ? best->power / total_power : 0.0;
    pattern.description = std::string(target.name) + " pattern detected";
    patterns.push_back(std::move(pattern));
  }
  return patterns;
}

} // namespace analysis
