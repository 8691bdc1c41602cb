#include "memory_record_store.hpp"

#include <algorithm>
#include <mutex>
#include <tuple>

void MemoryRecordStore::append_record(const LogRecord &record) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  records_.emplace(record.timestamp_ms, record);
}

void MemoryRecordStore::upsert_alert(const Alert &alert) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  alerts_[alert.id] = alert;
}

void MemoryRecordStore::put_integrity_stamp(const IntegrityStamp &stamp) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  stamps_[stamp.source_file_id] = stamp;
}

Page<LogRecord> MemoryRecordStore::query_records(const TimeRange &range,
                                                 const RecordFilter &filter,
                                                 const PageRequest &page) const {
  Page<LogRecord> result;
  result.page = page.page;
  result.page_size = page.page_size;

  size_t skip = (page.page > 0 ? page.page - 1 : 0) * page.page_size;

  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto begin = records_.lower_bound(range.from_ms);
  auto end = records_.lower_bound(range.to_ms);
  for (auto it = begin; it != end; ++it) {
    if (!filter.matches(it->second))
      continue;
    if (result.total_count >= skip &&
        result.items.size() < page.page_size)
      result.items.push_back(it->second);
    result.total_count++;
  }
  result.page_count = page_count_for(result.total_count, page.page_size);
  return result;
}

std::vector<Alert> MemoryRecordStore::query_alerts(const TimeRange &range,
                                                   size_t limit,
                                                   const AlertFilter &filter) const {
  std::vector<Alert> result;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &[id, alert] : alerts_)
      if (range.contains(alert.timestamp_ms) && filter.matches(alert))
        result.push_back(alert);
  }

  std::sort(result.begin(), result.end(), [](const Alert &a, const Alert &b) {
    return std::tie(b.timestamp_ms, b.id) < std::tie(a.timestamp_ms, a.id);
  });
  if (result.size() > limit)
    result.resize(limit);
  return result;
}

std::vector<IntegrityStamp> MemoryRecordStore::integrity_stamps() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<IntegrityStamp> result;
  result.reserve(stamps_.size());
  for (const auto &[source, stamp] : stamps_)
    result.push_back(stamp);
  return result;
}

size_t MemoryRecordStore::record_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.size();
}

size_t MemoryRecordStore::alert_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return alerts_.size();
}
