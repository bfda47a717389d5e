#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

// Process-wide prometheus registry holding the engine's instrumentation.
// Components look up their labelled series once and keep the references.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  // Cache lookups partitioned by operation kind and hit/miss outcome
  prometheus::Counter &cache_lookup(const std::string &operation,
                                    bool hit);

  // Wall-clock latency of one analysis or recommendation operation
  prometheus::Histogram &operation_duration(const std::string &operation);

  // Operations that resolved with success=false
  prometheus::Counter &operation_failure(const std::string &operation);

  // Feedback events by type (approval, rejection, rating, ...)
  prometheus::Counter &feedback_event(const std::string &feedback_type);

  std::string serialize_text() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  prometheus::Family<prometheus::Counter> &cache_lookups_;
  prometheus::Family<prometheus::Histogram> &operation_durations_;
  prometheus::Family<prometheus::Counter> &operation_failures_;
  prometheus::Family<prometheus::Counter> &feedback_events_;

  static const std::vector<double> &duration_buckets();
};

#endif // METRICS_REGISTRY_HPP
