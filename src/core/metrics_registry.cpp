#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {
  return create_counter_family(name, help).Add({});
}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
}

prometheus::Family<prometheus::Histogram> &
MetricsRegistry::create_histogram_family(const std::string &name,
                                         const std::string &help) {
  return prometheus::BuildHistogram().Name(name).Help(help).Register(
      *registry_);
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
