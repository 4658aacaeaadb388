#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <memory>
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>

// Owns one prometheus registry. The engine and the supervisor register their
// families here; the web server exposes the result on /metrics.
// Registering the same family name twice on one registry throws, so tests
// that build several engines give each its own registry.
class MetricsRegistry {
public:
  MetricsRegistry();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Unlabelled single series
  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  prometheus::Family<prometheus::Histogram> &
  create_histogram_family(const std::string &name, const std::string &help);

  // Prometheus text exposition format 0.0.4
  std::string serialize() const;

private:
  std::shared_ptr<prometheus::Registry> registry_;
};

#endif // METRICS_REGISTRY_HPP
