#ifndef CLASSIFIER_WINDOW_HPP
#define CLASSIFIER_WINDOW_HPP

#include "utils/sliding_window.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

// Sliding-window counters for one behavioral key (a client, a client and
// endpoint pair, or an endpoint). "Now" is the newest event time seen for the
// key; counters cover events in [now - window, now].
class ClassifierWindow {
public:
  // `max_tracked_endpoints` bounds the distinct-endpoint set; 0 disables it
  ClassifierWindow(std::string key, uint64_t window_ms, size_t max_events,
                   size_t max_tracked_endpoints = 0);

  // False when the event is older than the window and was not counted
  bool add(uint64_t timestamp_ms, int status_code, uint64_t bytes,
           const std::string &endpoint = "");

  const std::string &key() const { return key_; }
  uint64_t now() const { return now_ms_; }
  uint64_t window_start() const;
  uint64_t window_ms() const { return events_.duration_ms(); }

  size_t event_count() const { return events_.get_event_count(); }
  size_t status_4xx_count() const { return status_4xx_count_; }
  size_t status_401_403_count() const { return status_401_403_count_; }
  uint64_t bytes_total() const { return bytes_total_; }

  // Saturates at the tracking limit
  size_t distinct_endpoints() const { return endpoint_counts_.size(); }
  // Endpoints that answered 401/403 in the window; same limit
  size_t distinct_auth_failure_endpoints() const {
    return auth_failure_endpoint_counts_.size();
  }
  size_t endpoint_event_count(const std::string &endpoint) const;

  bool is_empty() const { return events_.is_empty(); }

  void reconfigure(uint64_t window_ms, size_t max_events);

private:
  struct Event {
    int status_code = 0;
    uint64_t bytes = 0;
    std::string endpoint;
    bool endpoint_tracked = false;
    bool auth_failure_endpoint_tracked = false;
  };

  // True when `endpoint` was counted (or already present) under the limit
  bool track_endpoint(std::unordered_map<std::string, size_t> &counts,
                      const std::string &endpoint);
  static void untrack_endpoint(std::unordered_map<std::string, size_t> &counts,
                               const std::string &endpoint);
  void forget(const Event &event);
  void prune();

  std::string key_;
  SlidingWindow<Event> events_;
  size_t max_tracked_endpoints_;
  uint64_t now_ms_ = 0;

  size_t status_4xx_count_ = 0;
  size_t status_401_403_count_ = 0;
  uint64_t bytes_total_ = 0;
  std::unordered_map<std::string, size_t> endpoint_counts_;
  std::unordered_map<std::string, size_t> auth_failure_endpoint_counts_;
};

#endif // CLASSIFIER_WINDOW_HPP
