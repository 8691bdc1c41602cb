#include "classifier_window.hpp"

#include <utility>

namespace {
bool is_auth_failure(int status_code) {
  return status_code == 401 || status_code == 403;
}
} // namespace

ClassifierWindow::ClassifierWindow(std::string key, uint64_t window_ms,
                                   size_t max_events,
                                   size_t max_tracked_endpoints)
    : key_(std::move(key)), events_(window_ms, max_events),
      max_tracked_endpoints_(max_tracked_endpoints) {}

uint64_t ClassifierWindow::window_start() const {
  uint64_t window = events_.duration_ms();
  return now_ms_ >= window ? now_ms_ - window : 0;
}

bool ClassifierWindow::add(uint64_t timestamp_ms, int status_code,
                           uint64_t bytes, const std::string &endpoint) {
  if (!events_.is_empty() && timestamp_ms < window_start())
    return false;

  Event event;
  event.status_code = status_code;
  event.bytes = bytes;

  if (max_tracked_endpoints_ > 0 && !endpoint.empty()) {
    event.endpoint_tracked = track_endpoint(endpoint_counts_, endpoint);
    if (is_auth_failure(status_code))
      event.auth_failure_endpoint_tracked =
          track_endpoint(auth_failure_endpoint_counts_, endpoint);
    if (event.endpoint_tracked || event.auth_failure_endpoint_tracked)
      event.endpoint = endpoint;
  }

  if (status_code >= 400 && status_code < 500)
    status_4xx_count_++;
  if (is_auth_failure(status_code))
    status_401_403_count_++;
  bytes_total_ += bytes;

  events_.add_event(timestamp_ms, std::move(event));
  if (timestamp_ms > now_ms_)
    now_ms_ = timestamp_ms;
  prune();
  return true;
}

bool ClassifierWindow::track_endpoint(
    std::unordered_map<std::string, size_t> &counts,
    const std::string &endpoint) {
  auto it = counts.find(endpoint);
  if (it != counts.end()) {
    it->second++;
    return true;
  }
  if (counts.size() >= max_tracked_endpoints_)
    return false;
  counts.emplace(endpoint, 1);
  return true;
}

void ClassifierWindow::untrack_endpoint(
    std::unordered_map<std::string, size_t> &counts,
    const std::string &endpoint) {
  auto it = counts.find(endpoint);
  if (it != counts.end() && --it->second == 0)
    counts.erase(it);
}

size_t ClassifierWindow::endpoint_event_count(const std::string &endpoint) const {
  auto it = endpoint_counts_.find(endpoint);
  return it == endpoint_counts_.end() ? 0 : it->second;
}

void ClassifierWindow::forget(const Event &event) {
  if (event.status_code >= 400 && event.status_code < 500)
    status_4xx_count_--;
  if (is_auth_failure(event.status_code))
    status_401_403_count_--;
  bytes_total_ -= event.bytes;

  if (event.endpoint_tracked)
    untrack_endpoint(endpoint_counts_, event.endpoint);
  if (event.auth_failure_endpoint_tracked)
    untrack_endpoint(auth_failure_endpoint_counts_, event.endpoint);
}

void ClassifierWindow::prune() {
  events_.prune_old_events(
      now_ms_, [this](const std::pair<uint64_t, Event> &expired) {
        forget(expired.second);
      });
}

void ClassifierWindow::reconfigure(uint64_t window_ms, size_t max_events) {
  events_.reconfigure(window_ms, max_events);
  prune();
}
