#ifndef SPACE_SAVING_HPP
#define SPACE_SAVING_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

// Space-Saving heavy hitters (Metwally et al.). Tracks at most `capacity`
// keys; a new key evicts the current minimum and inherits its count as
// overestimation error. Counts are exact while fewer than `capacity` distinct
// keys have been seen.
template <typename Key, typename Hash = std::hash<Key>> class SpaceSaving {
public:
  struct Entry {
    Key key;
    uint64_t count = 0;
    uint64_t error = 0;
  };

  explicit SpaceSaving(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  void offer(const Key &key, uint64_t weight = 1) {
    total_ += weight;
    auto it = counters_.find(key);
    if (it != counters_.end()) {
      it->second.count += weight;
      return;
    }
    if (counters_.size() < capacity_) {
      counters_.emplace(key, Counter{weight, 0});
      return;
    }

    auto min_it = std::min_element(
        counters_.begin(), counters_.end(), [](const auto &a, const auto &b) {
          return a.second.count < b.second.count;
        });
    uint64_t floor = min_it->second.count;
    counters_.erase(min_it);
    counters_.emplace(key, Counter{floor + weight, floor});
  }

  // Sums both summaries and keeps the `capacity` heaviest keys. A key missing
  // from a full summary may have been evicted from it, so it is charged that
  // summary's minimum count as both count and error.
  void merge(const SpaceSaving &other) {
    total_ += other.total_;
    const uint64_t my_floor = unseen_key_bound();
    const uint64_t other_floor = other.unseen_key_bound();

    for (auto &[key, counter] : counters_) {
      if (other.counters_.count(key) == 0) {
        counter.count += other_floor;
        counter.error += other_floor;
      }
    }
    for (const auto &[key, counter] : other.counters_) {
      auto it = counters_.find(key);
      if (it != counters_.end()) {
        it->second.count += counter.count;
        it->second.error += counter.error;
      } else {
        counters_.emplace(key, Counter{counter.count + my_floor,
                                       counter.error + my_floor});
      }
    }
    if (counters_.size() <= capacity_)
      return;

    std::vector<Entry> entries = sorted_entries();
    counters_.clear();
    for (size_t i = 0; i < capacity_; ++i)
      counters_.emplace(entries[i].key,
                        Counter{entries[i].count, entries[i].error});
  }

  // Highest counts first; ties broken by key for stable output
  std::vector<Entry> top(size_t limit) const {
    std::vector<Entry> entries = sorted_entries();
    if (entries.size() > limit)
      entries.resize(limit);
    return entries;
  }

  uint64_t total() const { return total_; }
  size_t size() const { return counters_.size(); }
  size_t capacity() const { return capacity_; }

private:
  struct Counter {
    uint64_t count = 0;
    uint64_t error = 0;
  };

  // Upper bound on the count of a key this summary does not hold
  uint64_t unseen_key_bound() const {
    if (counters_.size() < capacity_)
      return 0;
    uint64_t floor = UINT64_MAX;
    for (const auto &entry : counters_)
      floor = std::min(floor, entry.second.count);
    return floor;
  }

  std::vector<Entry> sorted_entries() const {
    std::vector<Entry> entries;
    entries.reserve(counters_.size());
    for (const auto &[key, counter] : counters_)
      entries.push_back(Entry{key, counter.count, counter.error});
    std::sort(entries.begin(), entries.end(),
              [](const Entry &a, const Entry &b) {
                if (a.count != b.count)
                  return a.count > b.count;
                return a.key < b.key;
              });
    return entries;
  }

  size_t capacity_;
  uint64_t total_ = 0;
  std::unordered_map<Key, Counter, Hash> counters_;
};

#endif // SPACE_SAVING_HPP
