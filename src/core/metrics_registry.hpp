#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

// Process-wide registry for the pipeline's own metrics. Registering the same
// name twice returns the existing metric, so components may be constructed
// more than once (tests, reloads). Names must start with "log_sentinel_".
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries =
                       default_latency_buckets());

  // Labeled series share one family; add them with Family::Add
  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help,
                        const std::map<std::string, std::string> &labels = {});

  // Prometheus text exposition format 0.0.4
  std::string serialize() const;

  // Seconds, from 10us to 1s
  static std::vector<double> default_latency_buckets();

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  static void check_name(const std::string &name);

  std::shared_ptr<prometheus::Registry> registry_;
};

#endif // METRICS_REGISTRY_HPP
