#include "core/metrics_registry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(MetricsRegistryTest, SameNameReturnsSameMetric) {
  auto &registry = MetricsRegistry::instance();
  auto &first = registry.create_counter("log_sentinel_test_events_total",
                                        "Events seen by the registry test");
  auto &second = registry.create_counter("log_sentinel_test_events_total",
                                         "Events seen by the registry test");
  EXPECT_EQ(&first, &second);

  double before = first.Value();
  second.Increment(2);
  EXPECT_DOUBLE_EQ(first.Value(), before + 2);
}

TEST(MetricsRegistryTest, SerializesTextExposition) {
  auto &registry = MetricsRegistry::instance();
  auto &family = registry.create_counter_family(
      "log_sentinel_test_kinds_total", "Per-kind counter for the test");
  family.Add({{"kind", "alpha"}}).Increment();
  registry.create_gauge("log_sentinel_test_depth", "Gauge for the test")
      .Set(7);

  std::string text = registry.serialize();
  EXPECT_NE(text.find("# TYPE log_sentinel_test_kinds_total counter"),
            std::string::npos);
  EXPECT_NE(text.find("log_sentinel_test_kinds_total{kind=\"alpha\"}"),
            std::string::npos);
  EXPECT_NE(text.find("log_sentinel_test_depth 7"), std::string::npos);
}

TEST(MetricsRegistryTest, RejectsForeignNames) {
  EXPECT_THROW(MetricsRegistry::instance().create_counter("requests_total",
                                                          "No prefix"),
               std::invalid_argument);
}
