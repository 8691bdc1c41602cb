#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

#include <stdexcept>

namespace {
constexpr const char *NAME_PREFIX = "log_sentinel_";
}

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

void MetricsRegistry::check_name(const std::string &name) {
  if (name.rfind(NAME_PREFIX, 0) != 0)
    throw std::invalid_argument("Metric '" + name + "' must start with " +
                                NAME_PREFIX);
}

std::vector<double> MetricsRegistry::default_latency_buckets() {
  return {0.00001, 0.00005, 0.0001, 0.0005, 0.001,
          0.005,   0.01,    0.05,   0.1,    0.5, 1.0};
}

// prometheus::Registry hands back the family already registered under a name
// and Family::Add the series already present for a label set.
prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {
  check_name(name);
  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Register(*registry_)
      .Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {
  check_name(name);
  return prometheus::BuildGauge()
      .Name(name)
      .Help(help)
      .Register(*registry_)
      .Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {
  check_name(name);
  return prometheus::BuildHistogram()
      .Name(name)
      .Help(help)
      .Register(*registry_)
      .Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &MetricsRegistry::create_counter_family(
    const std::string &name, const std::string &help,
    const std::map<std::string, std::string> &labels) {
  check_name(name);
  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Labels(labels)
      .Register(*registry_);
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
