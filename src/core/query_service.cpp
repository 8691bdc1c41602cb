#include "query_service.hpp"
#include "errors.hpp"
#include "ingestion_pipeline.hpp"
#include "io/store/record_store.hpp"

#include <string>

QueryService::QueryService(std::shared_ptr<const IRecordStore> store,
                           std::shared_ptr<const MetricsAggregator> aggregator,
                           std::shared_ptr<const IngestionPipeline> pipeline,
                           size_t max_page_size)
    : store_(std::move(store)), aggregator_(std::move(aggregator)),
      pipeline_(std::move(pipeline)), max_page_size_(max_page_size) {}

void QueryService::validate_range(const TimeRange &range) {
  if (range.to_ms < range.from_ms)
    throw QueryError("Range end " + std::to_string(range.to_ms) +
                     " is before its start " + std::to_string(range.from_ms));
}

std::vector<MetricsBucket> QueryService::metrics(const TimeRange &range,
                                                 Granularity granularity) const {
  validate_range(range);
  return aggregator_->query(range, granularity);
}

std::vector<MetricsBucket>
QueryService::timeline(const TimeRange &range, Granularity granularity) const {
  validate_range(range);
  return aggregator_->timeline(range, granularity);
}

TrafficSummary QueryService::summary(const TimeRange &range) const {
  validate_range(range);
  return aggregator_->summary(range);
}

std::vector<TopEntry> QueryService::top(TopDimension dimension, size_t limit,
                                        const TimeRange &range) const {
  validate_range(range);
  if (limit == 0 || limit > MAX_TOP_LIMIT)
    throw QueryError("Top limit must be between 1 and " +
                     std::to_string(MAX_TOP_LIMIT));
  return aggregator_->top(dimension, limit, range);
}

std::vector<Alert> QueryService::alerts(const TimeRange &range, size_t limit,
                                        const AlertFilter &filter) const {
  validate_range(range);
  if (limit == 0 || limit > MAX_ALERT_LIMIT)
    throw QueryError("Alert limit must be between 1 and " +
                     std::to_string(MAX_ALERT_LIMIT));
  if (filter.min_confidence &&
      (*filter.min_confidence < 0.0 || *filter.min_confidence > 1.0))
    throw QueryError("Minimum confidence must be between 0 and 1");
  return store_->query_alerts(range, limit, filter);
}

Page<LogRecord> QueryService::records(const TimeRange &range,
                                      const RecordFilter &filter,
                                      const PageRequest &page) const {
  validate_range(range);
  if (page.page == 0)
    throw QueryError("Page numbers start at 1");
  size_t max_page_size = max_page_size_.load();
  if (page.page_size == 0 || page.page_size > max_page_size)
    throw QueryError("Page size must be between 1 and " +
                     std::to_string(max_page_size));
  if (filter.status_code &&
      (*filter.status_code < 100 || *filter.status_code > 599))
    throw QueryError("Status filter must be between 100 and 599");
  return store_->query_records(range, filter, page);
}

std::vector<IntegrityStamp> QueryService::integrity_stamps() const {
  return store_->integrity_stamps();
}

std::vector<BatchSummary> QueryService::batch_summaries() const {
  if (!pipeline_)
    return {};
  return pipeline_->batch_summaries();
}
