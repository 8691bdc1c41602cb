#ifndef METRICS_AGGREGATOR_HPP
#define METRICS_AGGREGATOR_HPP

#include "core/config.hpp"
#include "core/log_record.hpp"
#include "core/query_types.hpp"
#include "time_buckets.hpp"
#include "utils/cardinality_estimator.hpp"
#include "utils/space_saving.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct MetricsBucket {
  Granularity granularity = Granularity::Hour;
  uint64_t bucket_start_ms = 0;
  uint64_t request_count = 0;
  uint64_t error_count = 0; // status >= 400
  uint64_t bytes_total = 0;
  uint64_t unique_client_count = 0;
  uint64_t status_2xx = 0;
  uint64_t status_3xx = 0;
  uint64_t status_4xx = 0;
  uint64_t status_5xx = 0;
};

struct TrafficSummary {
  TimeRange range;
  uint64_t request_count = 0;
  uint64_t error_count = 0;
  uint64_t bytes_total = 0;
  uint64_t unique_client_count = 0;
  uint64_t status_2xx = 0;
  uint64_t status_3xx = 0;
  uint64_t status_4xx = 0;
  uint64_t status_5xx = 0;
  std::map<std::string, uint64_t> method_counts;
};

enum class TopDimension { ClientIp, Endpoint, UserAgent, StatusCode };

constexpr size_t TOP_DIMENSION_COUNT = 4;

const char *top_dimension_to_string(TopDimension dimension);
std::optional<TopDimension> top_dimension_from_string(std::string_view name);

struct TopEntry {
  std::string key;
  uint64_t count = 0;
  // Upper bound on how much `count` may overstate the true frequency
  uint64_t error = 0;
};

// Incremental hour/day/week/month counters. Updates are commutative, so the
// shard workers call `update` concurrently; each granularity has its own
// lock.
class MetricsAggregator {
public:
  // A series longer than this is rejected as an invalid query
  static constexpr size_t MAX_SERIES_BUCKETS = 20000;

  explicit MetricsAggregator(const Config::MetricsConfig &config);

  MetricsAggregator(const MetricsAggregator &) = delete;
  MetricsAggregator &operator=(const MetricsAggregator &) = delete;

  void update(const LogRecord &record);

  // Zero-filled series from the bucket holding `range.from_ms` up to
  // `range.to_ms`; a degenerate range gives that single bucket. Throws
  // QueryError when the series would be longer than MAX_SERIES_BUCKETS.
  std::vector<MetricsBucket> query(const TimeRange &range,
                                   Granularity granularity) const;

  std::vector<MetricsBucket> timeline(const TimeRange &range,
                                      Granularity granularity) const {
    return query(range, granularity);
  }

  // Answered at day resolution from the per-day summaries
  std::vector<TopEntry> top(TopDimension dimension, size_t limit,
                            const TimeRange &range) const;

  TrafficSummary summary(const TimeRange &range) const;

  size_t bucket_count(Granularity granularity) const;
  uint64_t records_aggregated() const { return records_aggregated_.load(); }

  void reconfigure(const Config::MetricsConfig &config);

private:
  struct BucketState {
    explicit BucketState(size_t exact_cap) : unique_clients(exact_cap) {}

    uint64_t request_count = 0;
    uint64_t error_count = 0;
    uint64_t bytes_total = 0;
    std::array<uint64_t, 4> status_classes{}; // 2xx..5xx
    std::map<std::string, uint64_t> method_counts;
    CardinalityEstimator unique_clients;
  };

  using TopSummary = SpaceSaving<std::string>;

  struct Level {
    mutable std::mutex mutex;
    std::map<uint64_t, BucketState> buckets;
  };

  struct TopLevel {
    mutable std::mutex mutex;
    // Day bucket start -> one summary per dimension
    std::map<uint64_t, std::vector<TopSummary>> days;
  };

  static void apply(BucketState &bucket, const LogRecord &record);
  static MetricsBucket to_bucket(Granularity granularity, uint64_t start,
                                 const BucketState *state);

  std::array<Level, GRANULARITY_COUNT> levels_;
  TopLevel top_;

  std::atomic<size_t> unique_clients_exact_cap_;
  std::atomic<size_t> top_k_capacity_;
  std::atomic<size_t> max_user_agent_length_;
  std::atomic<uint64_t> records_aggregated_{0};
};

#endif // METRICS_AGGREGATOR_HPP
