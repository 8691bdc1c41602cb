#include "detection/behavioral_classifier.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace {

constexpr uint64_t BASE_MS = 1672574400000; // 2023-01-01T12:00:00Z

LogRecord make_record(const std::string &ip, const std::string &path,
                      int status, uint64_t ts, uint64_t bytes = 100) {
  static uint64_t line = 0;
  LogRecord record;
  record.timestamp_ms = ts;
  record.client_ip = ip;
  record.method = "GET";
  record.path = path;
  record.status_code = status;
  record.bytes_sent = bytes;
  record.source_file_id = "behavior.log";
  record.line_offset = ++line;
  return record;
}

size_t count_type(const std::vector<BehaviorHit> &hits, AttackType type) {
  return std::count_if(hits.begin(), hits.end(), [type](const BehaviorHit &h) {
    return h.attack_type == type;
  });
}

} // namespace

TEST(BehavioralClassifierTest, BruteForceAboveThreshold) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 10;
  config.auth_window_seconds = 300;
  BehavioralClassifier classifier(config);

  size_t first_trigger = 0;
  std::vector<BehaviorHit> last_hits;
  for (size_t i = 1; i <= 15; ++i) {
    auto hits = classifier.observe(
        make_record("203.0.113.5", "/login", 401, BASE_MS + i * 1000));
    if (count_type(hits, AttackType::BruteForce) > 0 && first_trigger == 0)
      first_trigger = i;
    last_hits = hits;
  }

  // Strictly more than the threshold
  EXPECT_EQ(first_trigger, 11u);
  ASSERT_EQ(count_type(last_hits, AttackType::BruteForce), 1u);
  const BehaviorHit &hit = last_hits.front();
  EXPECT_EQ(hit.client_ip, "203.0.113.5");
  EXPECT_EQ(hit.endpoint, "/login");
  EXPECT_DOUBLE_EQ(hit.observed, 15.0);
  EXPECT_GE(hit.confidence, 0.9);
  EXPECT_LE(hit.confidence, 1.0);
}

TEST(BehavioralClassifierTest, NoBruteForceAtThreshold) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 10;
  BehavioralClassifier classifier(config);
  for (size_t i = 1; i <= 10; ++i) {
    auto hits = classifier.observe(
        make_record("203.0.113.6", "/login", 403, BASE_MS + i * 1000));
    EXPECT_EQ(count_type(hits, AttackType::BruteForce), 0u);
  }
}

TEST(BehavioralClassifierTest, FailuresOutsideWindowDoNotCount) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 3;
  config.auth_window_seconds = 10;
  BehavioralClassifier classifier(config);

  // One failure every 5s: never more than 3 inside a 10s window
  for (size_t i = 0; i < 20; ++i) {
    auto hits = classifier.observe(
        make_record("198.51.100.1", "/login", 401, BASE_MS + i * 5000));
    EXPECT_EQ(count_type(hits, AttackType::BruteForce), 0u);
  }
}

TEST(BehavioralClassifierTest, ScanAcrossManyEndpointsIsNotBruteForce) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 5;
  config.bruteforce_max_distinct_endpoints = 3;
  BehavioralClassifier classifier(config);

  for (size_t i = 0; i < 20; ++i) {
    auto hits = classifier.observe(make_record(
        "198.51.100.2", "/admin/" + std::to_string(i), 403, BASE_MS + i * 100));
    EXPECT_EQ(count_type(hits, AttackType::BruteForce), 0u);
  }
}

TEST(BehavioralClassifierTest, PageLoadsDoNotHideBruteForce) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 10;
  config.bruteforce_max_distinct_endpoints = 3;
  BehavioralClassifier classifier(config);

  const char *assets[] = {"/", "/static/app.css", "/static/app.js",
                          "/favicon.ico"};
  uint64_t ts = BASE_MS;
  for (const char *asset : assets)
    classifier.observe(make_record("203.0.113.7", asset, 200, ts += 100));

  size_t brute_force_hits = 0;
  for (size_t i = 0; i < 15; ++i)
    brute_force_hits += count_type(
        classifier.observe(make_record("203.0.113.7", "/login", 401,
                                       ts += 1000)),
        AttackType::BruteForce);
  EXPECT_EQ(brute_force_hits, 5u);
}

TEST(BehavioralClassifierTest, ClientRateDoS) {
  Config::BehaviorConfig config;
  config.request_rate_threshold = 50;
  config.rate_window_seconds = 10;
  BehavioralClassifier classifier(config);

  std::vector<BehaviorHit> hits;
  for (size_t i = 0; i < 60; ++i)
    hits = classifier.observe_client(make_record(
        "192.0.2.10", "/page/" + std::to_string(i % 10), 200, BASE_MS + i * 10));

  ASSERT_EQ(count_type(hits, AttackType::DoS), 1u);
  auto dos = std::find_if(hits.begin(), hits.end(), [](const BehaviorHit &h) {
    return h.attack_type == AttackType::DoS;
  });
  EXPECT_EQ(dos->client_ip, "192.0.2.10");
  EXPECT_EQ(dos->endpoint, WILDCARD_KEY);
  EXPECT_DOUBLE_EQ(dos->observed, 60.0);
}

TEST(BehavioralClassifierTest, AuthBurstLeftToBruteForce) {
  Config::BehaviorConfig config;
  config.request_rate_threshold = 20;
  config.auth_failure_threshold = 10;
  BehavioralClassifier classifier(config);

  std::vector<BehaviorHit> hits;
  for (size_t i = 0; i < 30; ++i)
    hits = classifier.observe_client(
        make_record("192.0.2.11", "/login", 401, BASE_MS + i * 10));
  EXPECT_EQ(count_type(hits, AttackType::DoS), 0u);
  EXPECT_EQ(count_type(hits, AttackType::BruteForce), 1u);
}

TEST(BehavioralClassifierTest, EndpointRateDoS) {
  Config::BehaviorConfig config;
  config.endpoint_rate_threshold = 30;
  BehavioralClassifier classifier(config);

  std::vector<BehaviorHit> hits;
  for (size_t i = 0; i < 31; ++i)
    hits = classifier.observe_endpoint(make_record(
        "10.9.0." + std::to_string(i), "/search", 200, BASE_MS + i * 10));

  ASSERT_EQ(count_type(hits, AttackType::DoS), 1u);
  EXPECT_EQ(hits.front().client_ip, WILDCARD_KEY);
  EXPECT_EQ(hits.front().endpoint, "/search");
}

TEST(BehavioralClassifierTest, VolumeExfiltration) {
  Config::BehaviorConfig config;
  config.bytes_threshold = 1000000;
  BehavioralClassifier classifier(config);

  std::vector<BehaviorHit> hits;
  for (size_t i = 0; i < 5; ++i)
    hits = classifier.observe_client(make_record(
        "192.0.2.50", "/export", 200, BASE_MS + i * 1000, 300000));
  ASSERT_EQ(count_type(hits, AttackType::DataExfiltration), 1u);
  EXPECT_DOUBLE_EQ(hits.front().observed, 1500000.0);
}

TEST(BehavioralClassifierTest, ResponseSizeOutlier) {
  Config::BehaviorConfig config;
  config.baseline_min_samples = 30;
  config.outlier_min_bytes = 100000;
  BehavioralClassifier classifier(config);

  for (size_t i = 0; i < 40; ++i) {
    auto hits = classifier.observe_endpoint(make_record(
        "10.0.0.1", "/report", 200, BASE_MS + i * 1000, 2000 + (i % 5) * 10));
    EXPECT_EQ(count_type(hits, AttackType::DataExfiltration), 0u);
  }

  auto hits = classifier.observe_endpoint(
      make_record("10.0.0.99", "/report", 200, BASE_MS + 41000, 5000000));
  ASSERT_EQ(count_type(hits, AttackType::DataExfiltration), 1u);
  EXPECT_EQ(hits.front().client_ip, "10.0.0.99");
  EXPECT_EQ(hits.front().endpoint, "/report");

  // The outlier did not move the baseline: a second one still fires
  hits = classifier.observe_endpoint(
      make_record("10.0.0.98", "/report", 200, BASE_MS + 42000, 5000000));
  EXPECT_EQ(count_type(hits, AttackType::DataExfiltration), 1u);
}

TEST(BehavioralClassifierTest, NoOutlierBeforeBaselineEstablished) {
  Config::BehaviorConfig config;
  config.baseline_min_samples = 30;
  config.outlier_min_bytes = 1;
  BehavioralClassifier classifier(config);
  classifier.observe_endpoint(make_record("10.0.0.1", "/r", 200, BASE_MS, 10));
  auto hits = classifier.observe_endpoint(
      make_record("10.0.0.1", "/r", 200, BASE_MS + 1, 99999999));
  EXPECT_EQ(count_type(hits, AttackType::DataExfiltration), 0u);
}

TEST(BehavioralClassifierTest, SweepEvictsIdleKeys) {
  Config::BehaviorConfig config;
  config.eviction_ttl_seconds = 3600;
  BehavioralClassifier classifier(config);

  classifier.observe(make_record("10.1.0.1", "/a", 200, BASE_MS));
  classifier.observe(make_record("10.1.0.2", "/b", 200, BASE_MS + 3000000));
  // client, pair and endpoint for each record
  EXPECT_EQ(classifier.tracked_keys(), 6u);

  size_t evicted = classifier.sweep(BASE_MS + 3700000);
  EXPECT_EQ(evicted, 3u);
  EXPECT_EQ(classifier.tracked_clients(), 1u);
  EXPECT_EQ(classifier.tracked_endpoints(), 1u);
  EXPECT_EQ(classifier.auth_window("10.1.0.1"), nullptr);
  EXPECT_NE(classifier.auth_window("10.1.0.2"), nullptr);
}

TEST(BehavioralClassifierTest, ReconfigureAppliesNewThreshold) {
  Config::BehaviorConfig config;
  config.auth_failure_threshold = 100;
  BehavioralClassifier classifier(config);
  for (size_t i = 0; i < 5; ++i)
    classifier.observe_client(
        make_record("10.2.0.1", "/login", 401, BASE_MS + i * 1000));

  config.auth_failure_threshold = 5;
  classifier.reconfigure(config);
  auto hits = classifier.observe_client(
      make_record("10.2.0.1", "/login", 401, BASE_MS + 6000));
  EXPECT_EQ(count_type(hits, AttackType::BruteForce), 1u);
  EXPECT_EQ(classifier.auth_window("10.2.0.1")->status_401_403_count(), 6u);
}

TEST(BehavioralClassifierTest, ScaledConfidence) {
  EXPECT_DOUBLE_EQ(BehavioralClassifier::scaled_confidence(10, 10, 0.7, 1.5),
                   0.7);
  EXPECT_DOUBLE_EQ(BehavioralClassifier::scaled_confidence(15, 10, 0.7, 1.5),
                   1.0);
  EXPECT_DOUBLE_EQ(BehavioralClassifier::scaled_confidence(100, 10, 0.7, 1.5),
                   1.0);
  EXPECT_NEAR(BehavioralClassifier::scaled_confidence(12.5, 10, 0.7, 1.5),
              0.85, 1e-9);
}
