#ifndef QUERY_SERVICE_HPP
#define QUERY_SERVICE_HPP

#include "alert.hpp"
#include "analysis/metrics_aggregator.hpp"
#include "ingest_types.hpp"
#include "log_record.hpp"
#include "query_types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

class IngestionPipeline;
class IRecordStore;

// Read-only queries over the store and the aggregator. Every call validates
// its arguments and throws QueryError for bad ones; store failures surface as
// StorageError.
class QueryService {
public:
  static constexpr size_t MAX_ALERT_LIMIT = 10000;
  static constexpr size_t MAX_TOP_LIMIT = 1000;

  QueryService(std::shared_ptr<const IRecordStore> store,
               std::shared_ptr<const MetricsAggregator> aggregator,
               std::shared_ptr<const IngestionPipeline> pipeline = nullptr,
               size_t max_page_size = 1000);

  std::vector<MetricsBucket> metrics(const TimeRange &range,
                                     Granularity granularity) const;
  std::vector<MetricsBucket> timeline(const TimeRange &range,
                                      Granularity granularity) const;
  TrafficSummary summary(const TimeRange &range) const;
  std::vector<TopEntry> top(TopDimension dimension, size_t limit,
                            const TimeRange &range) const;

  std::vector<Alert> alerts(const TimeRange &range, size_t limit,
                            const AlertFilter &filter) const;
  Page<LogRecord> records(const TimeRange &range, const RecordFilter &filter,
                          const PageRequest &page) const;

  std::vector<IntegrityStamp> integrity_stamps() const;
  std::vector<BatchSummary> batch_summaries() const;

  size_t max_page_size() const { return max_page_size_.load(); }
  void set_max_page_size(size_t max_page_size) {
    max_page_size_ = max_page_size;
  }

private:
  static void validate_range(const TimeRange &range);

  std::shared_ptr<const IRecordStore> store_;
  std::shared_ptr<const MetricsAggregator> aggregator_;
  std::shared_ptr<const IngestionPipeline> pipeline_;
  std::atomic<size_t> max_page_size_;
};

#endif // QUERY_SERVICE_HPP
