#include "metrics_aggregator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

namespace {
constexpr Granularity ALL_GRANULARITIES[] = {
    Granularity::Hour, Granularity::Day, Granularity::Week,
    Granularity::Month};

constexpr const char *KNOWN_METHODS[] = {"GET",   "POST",    "PUT",
                                         "DELETE", "HEAD",   "OPTIONS",
                                         "PATCH", "CONNECT", "TRACE"};

// Fixed set of method labels so hostile request lines cannot grow the map
const char *method_label(const std::string &method) {
  if (method.empty() || method == "-")
    return "-";
  for (const char *known : KNOWN_METHODS)
    if (method == known)
      return known;
  return "OTHER";
}
} // namespace

const char *top_dimension_to_string(TopDimension dimension) {
  switch (dimension) {
  case TopDimension::ClientIp:
    return "ip";
  case TopDimension::Endpoint:
    return "endpoint";
  case TopDimension::UserAgent:
    return "user_agent";
  case TopDimension::StatusCode:
    return "status";
  }
  return "unknown";
}

std::optional<TopDimension> top_dimension_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(name);
  if (lowered == "ip" || lowered == "client_ip")
    return TopDimension::ClientIp;
  if (lowered == "endpoint" || lowered == "path")
    return TopDimension::Endpoint;
  if (lowered == "user_agent" || lowered == "ua")
    return TopDimension::UserAgent;
  if (lowered == "status" || lowered == "status_code")
    return TopDimension::StatusCode;
  return std::nullopt;
}

MetricsAggregator::MetricsAggregator(const Config::MetricsConfig &config)
    : unique_clients_exact_cap_(config.unique_clients_exact_cap),
      top_k_capacity_(config.top_k_capacity),
      max_user_agent_length_(config.max_user_agent_length) {}

void MetricsAggregator::apply(BucketState &bucket, const LogRecord &record) {
  bucket.request_count++;
  bucket.bytes_total += record.bytes_sent;
  if (record.status_code >= 400)
    bucket.error_count++;
  int status_class = record.status_class();
  if (status_class >= 2 && status_class <= 5)
    bucket.status_classes[static_cast<size_t>(status_class - 2)]++;
  bucket.method_counts[method_label(record.method)]++;
  bucket.unique_clients.add(record.client_ip);
}

void MetricsAggregator::update(const LogRecord &record) {
  const size_t exact_cap = unique_clients_exact_cap_.load();
  for (Granularity granularity : ALL_GRANULARITIES) {
    Level &level = levels_[static_cast<size_t>(granularity)];
    uint64_t start = bucket_start(record.timestamp_ms, granularity);
    std::lock_guard<std::mutex> lock(level.mutex);
    auto it = level.buckets.find(start);
    if (it == level.buckets.end())
      it = level.buckets.emplace(start, BucketState(exact_cap)).first;
    apply(it->second, record);
  }

  std::string user_agent = record.user_agent.empty() ? "-" : record.user_agent;
  size_t max_ua = max_user_agent_length_.load();
  if (max_ua > 0 && user_agent.size() > max_ua)
    user_agent.resize(max_ua);

  {
    uint64_t day = bucket_start(record.timestamp_ms, Granularity::Day);
    const size_t capacity = top_k_capacity_.load();
    std::lock_guard<std::mutex> lock(top_.mutex);
    auto it = top_.days.find(day);
    if (it == top_.days.end())
      it = top_.days
               .emplace(day, std::vector<TopSummary>(TOP_DIMENSION_COUNT,
                                                     TopSummary(capacity)))
               .first;
    auto &summaries = it->second;
    summaries[static_cast<size_t>(TopDimension::ClientIp)].offer(
        record.client_ip);
    summaries[static_cast<size_t>(TopDimension::Endpoint)].offer(
        record.endpoint());
    summaries[static_cast<size_t>(TopDimension::UserAgent)].offer(user_agent);
    summaries[static_cast<size_t>(TopDimension::StatusCode)].offer(
        std::to_string(record.status_code));
  }
  records_aggregated_++;
}

MetricsBucket MetricsAggregator::to_bucket(Granularity granularity,
                                           uint64_t start,
                                           const BucketState *state) {
  MetricsBucket bucket;
  bucket.granularity = granularity;
  bucket.bucket_start_ms = start;
  if (!state)
    return bucket;
  bucket.request_count = state->request_count;
  bucket.error_count = state->error_count;
  bucket.bytes_total = state->bytes_total;
  bucket.unique_client_count = state->unique_clients.estimate();
  bucket.status_2xx = state->status_classes[0];
  bucket.status_3xx = state->status_classes[1];
  bucket.status_4xx = state->status_classes[2];
  bucket.status_5xx = state->status_classes[3];
  return bucket;
}

std::vector<MetricsBucket>
MetricsAggregator::query(const TimeRange &range,
                         Granularity granularity) const {
  std::vector<uint64_t> starts;
  uint64_t start = bucket_start(range.from_ms, granularity);
  starts.push_back(start);
  for (uint64_t next = next_bucket_start(start, granularity);
       next < range.to_ms; next = next_bucket_start(next, granularity)) {
    if (starts.size() >= MAX_SERIES_BUCKETS)
      throw QueryError(std::string("Range spans more than ") +
                       std::to_string(MAX_SERIES_BUCKETS) + " " +
                       granularity_to_string(granularity) + " buckets");
    starts.push_back(next);
  }

  std::vector<MetricsBucket> series;
  series.reserve(starts.size());

  const Level &level = levels_[static_cast<size_t>(granularity)];
  std::lock_guard<std::mutex> lock(level.mutex);
  for (uint64_t bucket : starts) {
    auto it = level.buckets.find(bucket);
    series.push_back(to_bucket(granularity, bucket,
                               it == level.buckets.end() ? nullptr
                                                         : &it->second));
  }
  return series;
}

std::vector<TopEntry> MetricsAggregator::top(TopDimension dimension,
                                             size_t limit,
                                             const TimeRange &range) const {
  TopSummary merged(top_k_capacity_.load());
  {
    uint64_t first_day = bucket_start(range.from_ms, Granularity::Day);
    std::lock_guard<std::mutex> lock(top_.mutex);
    auto begin = top_.days.lower_bound(first_day);
    auto end = range.to_ms > range.from_ms ? top_.days.lower_bound(range.to_ms)
                                           : top_.days.upper_bound(first_day);
    for (auto it = begin; it != end; ++it)
      merged.merge(it->second[static_cast<size_t>(dimension)]);
  }

  std::vector<TopEntry> result;
  for (auto &entry : merged.top(limit))
    result.push_back(TopEntry{std::move(entry.key), entry.count, entry.error});
  return result;
}

TrafficSummary MetricsAggregator::summary(const TimeRange &range) const {
  TrafficSummary summary;
  summary.range = range;
  CardinalityEstimator unique_clients(unique_clients_exact_cap_.load());

  const Level &level = levels_[static_cast<size_t>(Granularity::Hour)];
  uint64_t first_hour = bucket_start(range.from_ms, Granularity::Hour);
  std::lock_guard<std::mutex> lock(level.mutex);
  auto begin = level.buckets.lower_bound(first_hour);
  auto end = range.to_ms > range.from_ms
                 ? level.buckets.lower_bound(range.to_ms)
                 : level.buckets.upper_bound(first_hour);
  for (auto it = begin; it != end; ++it) {
    const BucketState &state = it->second;
    summary.request_count += state.request_count;
    summary.error_count += state.error_count;
    summary.bytes_total += state.bytes_total;
    summary.status_2xx += state.status_classes[0];
    summary.status_3xx += state.status_classes[1];
    summary.status_4xx += state.status_classes[2];
    summary.status_5xx += state.status_classes[3];
    for (const auto &[method, count] : state.method_counts)
      summary.method_counts[method] += count;
    unique_clients.merge(state.unique_clients);
  }
  summary.unique_client_count = unique_clients.estimate();
  return summary;
}

size_t MetricsAggregator::bucket_count(Granularity granularity) const {
  const Level &level = levels_[static_cast<size_t>(granularity)];
  std::lock_guard<std::mutex> lock(level.mutex);
  return level.buckets.size();
}

void MetricsAggregator::reconfigure(const Config::MetricsConfig &config) {
  // Applies to buckets created from now on
  unique_clients_exact_cap_ = config.unique_clients_exact_cap;
  top_k_capacity_ = config.top_k_capacity;
  max_user_agent_length_ = config.max_user_agent_length;
  LOG(LogLevel::DEBUG, LogComponent::METRICS,
      "Metrics aggregator reconfigured (top_k_capacity="
          << config.top_k_capacity << ")");
}
