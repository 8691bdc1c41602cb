#include "behavioral_classifier.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

bool is_auth_failure(int status_code) {
  return status_code == 401 || status_code == 403;
}

std::string format_ratio(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

} // namespace

BehavioralClassifier::ClientState::ClientState(
    const std::string &ip, const Config::BehaviorConfig &config)
    : auth(ip, config.auth_window_seconds * 1000, config.max_events_per_window,
           config.max_tracked_endpoints),
      rate(ip, config.rate_window_seconds * 1000, config.max_events_per_window,
           config.max_tracked_endpoints),
      transfer(ip, config.transfer_window_seconds * 1000,
               config.max_events_per_window) {}

BehavioralClassifier::EndpointState::EndpointState(
    const std::string &endpoint, const Config::BehaviorConfig &config)
    : rate(endpoint, config.rate_window_seconds * 1000,
           config.max_events_per_window),
      bytes_baseline(config.baseline_alpha) {}

BehavioralClassifier::BehavioralClassifier(
    const Config::BehaviorConfig &config)
    : config_(config),
      tracked_keys_gauge_(MetricsRegistry::instance().create_gauge(
          "log_sentinel_behavior_tracked_keys",
          "Client, pair and endpoint keys held by the behavioral classifier")) {
}

BehavioralClassifier::~BehavioralClassifier() {
  tracked_keys_gauge_.Decrement(static_cast<double>(tracked_keys()));
}

double BehavioralClassifier::scaled_confidence(double observed,
                                               double threshold, double floor,
                                               double saturation_ratio) {
  if (threshold <= 0.0)
    return 1.0;
  double ratio = observed / threshold;
  double scaled =
      floor + (1.0 - floor) * (ratio - 1.0) / (saturation_ratio - 1.0);
  return std::clamp(scaled, floor, 1.0);
}

double BehavioralClassifier::confidence_for(double observed,
                                            double threshold) const {
  return scaled_confidence(observed, threshold, config_.confidence_floor,
                           config_.saturation_ratio);
}

size_t BehavioralClassifier::tracked_keys() const {
  return clients_.size() + endpoints_.size() + pair_count_;
}

BehavioralClassifier::ClientState &
BehavioralClassifier::client_state(const std::string &ip) {
  auto it = clients_.find(ip);
  if (it == clients_.end()) {
    it = clients_.emplace(ip, ClientState(ip, config_)).first;
    tracked_keys_gauge_.Increment();
    LOG(LogLevel::TRACE, LogComponent::BEHAVIOR,
        "Tracking new client " << ip);
  }
  return it->second;
}

BehavioralClassifier::EndpointState &
BehavioralClassifier::endpoint_state(const std::string &endpoint) {
  auto it = endpoints_.find(endpoint);
  if (it == endpoints_.end()) {
    it = endpoints_.emplace(endpoint, EndpointState(endpoint, config_)).first;
    tracked_keys_gauge_.Increment();
  }
  return it->second;
}

ClassifierWindow &
BehavioralClassifier::pair_window(ClientState &state,
                                  const std::string &endpoint) {
  auto it = state.pairs.find(endpoint);
  if (it != state.pairs.end())
    return it->second;

  if (state.pairs.size() >= config_.max_endpoint_pairs_per_ip) {
    // Make room by dropping the pair that saw traffic least recently
    auto stalest = std::min_element(
        state.pairs.begin(), state.pairs.end(),
        [](const auto &a, const auto &b) {
          return a.second.now() < b.second.now();
        });
    state.pairs.erase(stalest);
    pair_count_--;
    tracked_keys_gauge_.Decrement();
  }

  it = state.pairs
           .emplace(endpoint,
                    ClassifierWindow(state.auth.key() + "|" + endpoint,
                                     config_.auth_window_seconds * 1000,
                                     config_.max_events_per_window))
           .first;
  pair_count_++;
  tracked_keys_gauge_.Increment();
  return it->second;
}

std::vector<BehaviorHit>
BehavioralClassifier::observe(const LogRecord &record) {
  std::vector<BehaviorHit> hits = observe_client(record);
  std::vector<BehaviorHit> endpoint_hits = observe_endpoint(record);
  hits.insert(hits.end(), std::make_move_iterator(endpoint_hits.begin()),
              std::make_move_iterator(endpoint_hits.end()));
  return hits;
}

std::vector<BehaviorHit>
BehavioralClassifier::observe_client(const LogRecord &record) {
  std::vector<BehaviorHit> hits;
  const std::string endpoint = record.endpoint();
  const uint64_t ts = record.timestamp_ms;
  latest_event_ms_ = std::max(latest_event_ms_, ts);

  ClientState &state = client_state(record.client_ip);
  state.last_seen_ms = std::max(state.last_seen_ms, ts);

  bool in_auth = state.auth.add(ts, record.status_code, record.bytes_sent,
                                endpoint);
  bool in_rate = state.rate.add(ts, record.status_code, record.bytes_sent,
                                endpoint);
  bool in_transfer =
      state.transfer.add(ts, record.status_code, record.bytes_sent);
  ClassifierWindow &pair = pair_window(state, endpoint);
  pair.add(ts, record.status_code, record.bytes_sent);

  // Brute force: repeated auth failures concentrated on few endpoints.
  // Successful requests do not count toward the diversity.
  if (in_auth && is_auth_failure(record.status_code)) {
    size_t failures = state.auth.status_401_403_count();
    size_t failing_endpoints = state.auth.distinct_auth_failure_endpoints();
    if (failures > config_.auth_failure_threshold &&
        failing_endpoints <= config_.bruteforce_max_distinct_endpoints) {
      std::ostringstream evidence;
      evidence << failures << " 401/403 responses within "
               << config_.auth_window_seconds << "s (threshold "
               << config_.auth_failure_threshold << "), "
               << pair.status_401_403_count() << " on " << endpoint << ", "
               << failing_endpoints << " failing endpoints";
      hits.push_back(BehaviorHit{
          AttackType::BruteForce, record.client_ip, endpoint,
          confidence_for(static_cast<double>(failures),
                         static_cast<double>(config_.auth_failure_threshold)),
          static_cast<double>(failures),
          static_cast<double>(config_.auth_failure_threshold),
          evidence.str()});
    }
  }

  // DoS from one client, unless the burst is really an auth attack
  if (in_rate && state.rate.event_count() > config_.request_rate_threshold) {
    size_t requests = state.rate.event_count();
    double auth_share = static_cast<double>(state.rate.status_401_403_count()) /
                        static_cast<double>(requests);
    bool low_diversity = state.rate.distinct_endpoints() <=
                         config_.bruteforce_max_distinct_endpoints;
    if (auth_share >= config_.dos_auth_failure_share && low_diversity) {
      LOG(LogLevel::TRACE, LogComponent::BEHAVIOR,
          "Rate burst from " << record.client_ip
                             << " left to brute force detection (auth share "
                             << format_ratio(auth_share) << ")");
    } else {
      std::ostringstream evidence;
      evidence << requests << " requests within "
               << config_.rate_window_seconds << "s (threshold "
               << config_.request_rate_threshold << ") across "
               << state.rate.distinct_endpoints() << " endpoints";
      hits.push_back(BehaviorHit{
          AttackType::DoS, record.client_ip, WILDCARD_KEY,
          confidence_for(static_cast<double>(requests),
                         static_cast<double>(config_.request_rate_threshold)),
          static_cast<double>(requests),
          static_cast<double>(config_.request_rate_threshold),
          evidence.str()});
    }
  }

  // Exfiltration by sustained volume
  if (in_transfer && state.transfer.bytes_total() > config_.bytes_threshold) {
    uint64_t bytes = state.transfer.bytes_total();
    std::ostringstream evidence;
    evidence << bytes << " bytes sent within "
             << config_.transfer_window_seconds << "s (threshold "
             << config_.bytes_threshold << ")";
    hits.push_back(BehaviorHit{
        AttackType::DataExfiltration, record.client_ip, WILDCARD_KEY,
        confidence_for(static_cast<double>(bytes),
                       static_cast<double>(config_.bytes_threshold)),
        static_cast<double>(bytes), static_cast<double>(config_.bytes_threshold),
        evidence.str()});
  }

  for (const auto &hit : hits)
    LOG(LogLevel::DEBUG, LogComponent::BEHAVIOR,
        attack_type_to_string(hit.attack_type)
            << " trigger for " << hit.client_ip << " on " << hit.endpoint
            << " (confidence " << format_ratio(hit.confidence)
            << "): " << hit.evidence);
  return hits;
}

std::vector<BehaviorHit>
BehavioralClassifier::observe_endpoint(const LogRecord &record) {
  std::vector<BehaviorHit> hits;
  const std::string endpoint = record.endpoint();
  const uint64_t ts = record.timestamp_ms;
  latest_event_ms_ = std::max(latest_event_ms_, ts);

  EndpointState &state = endpoint_state(endpoint);
  state.last_seen_ms = std::max(state.last_seen_ms, ts);

  bool in_rate = state.rate.add(ts, record.status_code, record.bytes_sent);
  if (in_rate && state.rate.event_count() > config_.endpoint_rate_threshold) {
    size_t requests = state.rate.event_count();
    std::ostringstream evidence;
    evidence << requests << " requests to " << endpoint << " within "
             << config_.rate_window_seconds << "s (threshold "
             << config_.endpoint_rate_threshold << ")";
    hits.push_back(BehaviorHit{
        AttackType::DoS, WILDCARD_KEY, endpoint,
        confidence_for(static_cast<double>(requests),
                       static_cast<double>(config_.endpoint_rate_threshold)),
        static_cast<double>(requests),
        static_cast<double>(config_.endpoint_rate_threshold), evidence.str()});
  }

  // Single-response outlier against the endpoint's own baseline
  double bytes = static_cast<double>(record.bytes_sent);
  bool outlier = false;
  if (state.bytes_baseline.is_established(config_.baseline_min_samples)) {
    double cutoff =
        std::max(static_cast<double>(config_.outlier_min_bytes),
                 state.bytes_baseline.upper_bound(
                     config_.outlier_stddev_multiplier));
    if (bytes > cutoff) {
      outlier = true;
      std::ostringstream evidence;
      evidence << record.bytes_sent << " bytes in one response from "
               << endpoint << " (baseline mean "
               << format_ratio(state.bytes_baseline.get_mean())
               << ", cutoff " << format_ratio(cutoff) << ")";
      hits.push_back(BehaviorHit{AttackType::DataExfiltration,
                                 record.client_ip, endpoint,
                                 confidence_for(bytes, cutoff), bytes, cutoff,
                                 evidence.str()});
    }
  }
  // Flagged outliers stay out of the baseline so it does not drift upward
  if (!outlier)
    state.bytes_baseline.add_value(bytes, ts);

  for (const auto &hit : hits)
    LOG(LogLevel::DEBUG, LogComponent::BEHAVIOR,
        attack_type_to_string(hit.attack_type)
            << " trigger on " << hit.endpoint << " (confidence "
            << format_ratio(hit.confidence) << "): " << hit.evidence);
  return hits;
}

size_t BehavioralClassifier::sweep(uint64_t now_ms) {
  uint64_t ttl = config_.effective_eviction_ttl_ms();
  if (now_ms <= ttl)
    return 0;
  uint64_t cutoff = now_ms - ttl;
  size_t evicted = 0;

  for (auto it = clients_.begin(); it != clients_.end();) {
    if (it->second.last_seen_ms < cutoff) {
      evicted += 1 + it->second.pairs.size();
      pair_count_ -= it->second.pairs.size();
      it = clients_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = endpoints_.begin(); it != endpoints_.end();) {
    if (it->second.last_seen_ms < cutoff) {
      ++evicted;
      it = endpoints_.erase(it);
    } else {
      ++it;
    }
  }

  if (evicted > 0) {
    tracked_keys_gauge_.Decrement(static_cast<double>(evicted));
    LOG(LogLevel::DEBUG, LogComponent::BEHAVIOR,
        "Swept " << evicted << " idle keys; " << tracked_keys()
                 << " still tracked");
  }
  return evicted;
}

void BehavioralClassifier::reconfigure(const Config::BehaviorConfig &config) {
  config_ = config;
  for (auto &[ip, state] : clients_) {
    state.auth.reconfigure(config.auth_window_seconds * 1000,
                           config.max_events_per_window);
    state.rate.reconfigure(config.rate_window_seconds * 1000,
                           config.max_events_per_window);
    state.transfer.reconfigure(config.transfer_window_seconds * 1000,
                               config.max_events_per_window);
    for (auto &[endpoint, pair] : state.pairs)
      pair.reconfigure(config.auth_window_seconds * 1000,
                       config.max_events_per_window);
  }
  for (auto &[endpoint, state] : endpoints_) {
    state.rate.reconfigure(config.rate_window_seconds * 1000,
                           config.max_events_per_window);
    state.bytes_baseline.set_alpha(config.baseline_alpha);
  }
}

const ClassifierWindow *
BehavioralClassifier::auth_window(const std::string &client_ip) const {
  auto it = clients_.find(client_ip);
  return it == clients_.end() ? nullptr : &it->second.auth;
}
