#ifndef SLIDING_WINDOW_HPP
#define SLIDING_WINDOW_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>

// Time-ordered window of (timestamp, value) pairs. Events may arrive slightly
// out of order; they are inserted at their sorted position.
template <typename ValueType> class SlidingWindow {
public:
  using Element = std::pair<uint64_t, ValueType>;

  SlidingWindow(uint64_t duration_ms, size_t max_elements_limit = 0)
      : configured_duration_ms(duration_ms),
        configured_max_elements(max_elements_limit){};

  void add_event(uint64_t event_timestamp_ms, ValueType value) {
    if (window_data.empty() || window_data.back().first <= event_timestamp_ms) {
      window_data.emplace_back(event_timestamp_ms, std::move(value));
      return;
    }
    auto position = std::upper_bound(
        window_data.begin(), window_data.end(), event_timestamp_ms,
        [](uint64_t time, const Element &element) {
          return time < element.first;
        });
    window_data.emplace(position, event_timestamp_ms, std::move(value));
  }

  // Drops events older than `current_time_ms - duration` and, when a size
  // limit is set, the oldest events above it. `on_evict` sees each dropped
  // element before it is erased.
  template <typename EvictFn>
  size_t prune_old_events(uint64_t current_time_ms, EvictFn &&on_evict) {
    size_t evicted = 0;
    // 1. Time based pruning
    if (configured_duration_ms > 0 && !window_data.empty()) {
      uint64_t cutoff_timestamp = 0;
      // Avoid underflow if current_time_ms is less than the duration
      if (current_time_ms >= configured_duration_ms)
        cutoff_timestamp = current_time_ms - configured_duration_ms;

      while (!window_data.empty() &&
             window_data.front().first < cutoff_timestamp) {
        on_evict(window_data.front());
        window_data.pop_front();
        ++evicted;
      }
    }

    // 2. Size based pruning
    if (configured_max_elements > 0)
      while (window_data.size() > configured_max_elements) {
        on_evict(window_data.front());
        window_data.pop_front();
        ++evicted;
      }
    return evicted;
  }

  size_t prune_old_events(uint64_t current_time_ms) {
    return prune_old_events(current_time_ms, [](const Element &) {});
  }

  size_t get_event_count() const { return window_data.size(); }

  bool is_empty() const { return window_data.empty(); }

  uint64_t duration_ms() const { return configured_duration_ms; }

  void reconfigure(uint64_t new_duration_ms, size_t new_max_elements = 0) {
    configured_duration_ms = new_duration_ms;
    configured_max_elements = new_max_elements;
  }

private:
  std::deque<Element> window_data;
  uint64_t configured_duration_ms;
  size_t configured_max_elements; // 0 means no limit
};

#endif // SLIDING_WINDOW_HPP
