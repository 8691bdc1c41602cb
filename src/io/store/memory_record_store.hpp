#ifndef MEMORY_RECORD_STORE_HPP
#define MEMORY_RECORD_STORE_HPP

#include "record_store.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

class MemoryRecordStore : public IRecordStore {
public:
  void append_record(const LogRecord &record) override;
  void upsert_alert(const Alert &alert) override;
  void put_integrity_stamp(const IntegrityStamp &stamp) override;

  Page<LogRecord> query_records(const TimeRange &range,
                                const RecordFilter &filter,
                                const PageRequest &page) const override;
  std::vector<Alert> query_alerts(const TimeRange &range, size_t limit,
                                  const AlertFilter &filter) const override;
  std::vector<IntegrityStamp> integrity_stamps() const override;

  size_t record_count() const override;
  size_t alert_count() const;

private:
  mutable std::shared_mutex mutex_;
  std::multimap<uint64_t, LogRecord> records_;
  std::unordered_map<std::string, Alert> alerts_;
  std::map<std::string, IntegrityStamp> stamps_;
};

#endif // MEMORY_RECORD_STORE_HPP
