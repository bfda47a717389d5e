#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()),
      cache_lookups_(prometheus::BuildCounter()
                         .Name("homesense_cache_lookups_total")
                         .Help("Result cache lookups by operation and outcome")
                         .Register(*registry_)),
      operation_durations_(
          prometheus::BuildHistogram()
              .Name("homesense_operation_duration_seconds")
              .Help("Latency of analysis and recommendation operations")
              .Register(*registry_)),
      operation_failures_(prometheus::BuildCounter()
                              .Name("homesense_operation_failures_total")
                              .Help("Operations resolved with success=false")
                              .Register(*registry_)),
      feedback_events_(prometheus::BuildCounter()
                           .Name("homesense_feedback_events_total")
                           .Help("Recommendation feedback events by type")
                           .Register(*registry_)) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

const std::vector<double> &MetricsRegistry::duration_buckets() {
  static const std::vector<double> buckets = {0.0005, 0.001, 0.005, 0.01,
                                              0.05,   0.1,   0.5,   1.0};
  return buckets;
}

prometheus::Counter &MetricsRegistry::cache_lookup(const std::string &operation,
                                                   bool hit) {
  // Family::Add returns the existing series when the labels match
  return cache_lookups_.Add(
      {{"operation", operation}, {"outcome", hit ? "hit" : "miss"}});
}

prometheus::Histogram &
MetricsRegistry::operation_duration(const std::string &operation) {
  return operation_durations_.Add({{"operation", operation}},
                                  duration_buckets());
}

prometheus::Counter &
MetricsRegistry::operation_failure(const std::string &operation) {
  return operation_failures_.Add({{"operation", operation}});
}

prometheus::Counter &
MetricsRegistry::feedback_event(const std::string &feedback_type) {
  return feedback_events_.Add({{"type", feedback_type}});
}

std::string MetricsRegistry::serialize_text() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
