#ifndef BEHAVIORAL_CLASSIFIER_HPP
#define BEHAVIORAL_CLASSIFIER_HPP

#include "classifier_window.hpp"
#include "core/alert.hpp"
#include "core/config.hpp"
#include "core/log_record.hpp"
#include "utils/ewma_baseline.hpp"

#include <prometheus/gauge.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Stateful brute force, DoS and exfiltration detection over sliding windows.
// An instance is owned by a single worker; the pipeline runs one per shard
// and routes client-keyed and endpoint-keyed halves to the owning shard.
class BehavioralClassifier {
public:
  explicit BehavioralClassifier(const Config::BehaviorConfig &config);
  ~BehavioralClassifier();

  BehavioralClassifier(const BehavioralClassifier &) = delete;
  BehavioralClassifier &operator=(const BehavioralClassifier &) = delete;

  // Both halves, for a classifier that owns every key
  std::vector<BehaviorHit> observe(const LogRecord &record);

  // Client-keyed windows: brute force, DoS per IP, exfiltration by volume
  std::vector<BehaviorHit> observe_client(const LogRecord &record);

  // Endpoint-keyed windows: DoS per endpoint, exfiltration by outlier
  std::vector<BehaviorHit> observe_endpoint(const LogRecord &record);

  // Evicts keys idle for longer than the eviction TTL. Returns how many.
  size_t sweep(uint64_t now_ms);

  size_t tracked_keys() const;
  size_t tracked_clients() const { return clients_.size(); }
  size_t tracked_endpoints() const { return endpoints_.size(); }

  // Newest event time observed by either half
  uint64_t latest_event_ms() const { return latest_event_ms_; }

  // Adopts new thresholds and window lengths without dropping state
  void reconfigure(const Config::BehaviorConfig &config);

  const ClassifierWindow *auth_window(const std::string &client_ip) const;

  static double scaled_confidence(double observed, double threshold,
                                  double floor, double saturation_ratio);

private:
  struct ClientState {
    ClientState(const std::string &ip, const Config::BehaviorConfig &config);

    ClassifierWindow auth;
    ClassifierWindow rate;
    ClassifierWindow transfer;
    // Auth window per endpoint for this client
    std::unordered_map<std::string, ClassifierWindow> pairs;
    uint64_t last_seen_ms = 0;
  };

  struct EndpointState {
    EndpointState(const std::string &endpoint,
                  const Config::BehaviorConfig &config);

    ClassifierWindow rate;
    EwmaBaseline bytes_baseline;
    uint64_t last_seen_ms = 0;
  };

  ClientState &client_state(const std::string &ip);
  EndpointState &endpoint_state(const std::string &endpoint);
  ClassifierWindow &pair_window(ClientState &state,
                                const std::string &endpoint);

  double confidence_for(double observed, double threshold) const;

  Config::BehaviorConfig config_;
  std::unordered_map<std::string, ClientState> clients_;
  std::unordered_map<std::string, EndpointState> endpoints_;
  size_t pair_count_ = 0;
  uint64_t latest_event_ms_ = 0;

  prometheus::Gauge &tracked_keys_gauge_;
};

#endif // BEHAVIORAL_CLASSIFIER_HPP
