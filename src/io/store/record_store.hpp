#ifndef RECORD_STORE_HPP
#define RECORD_STORE_HPP

#include "core/alert.hpp"
#include "core/ingest_types.hpp"
#include "core/log_record.hpp"
#include "core/query_types.hpp"

#include <cstddef>
#include <vector>

// Persistence boundary for records, alerts and integrity stamps. Writes throw
// StorageError; a record counts as committed only once append_record returns.
// Implementations must be safe for concurrent use.
class IRecordStore {
public:
  virtual ~IRecordStore() = default;

  virtual void append_record(const LogRecord &record) = 0;

  // Inserts, or replaces the alert with the same id
  virtual void upsert_alert(const Alert &alert) = 0;

  // Keeps the latest stamp per source
  virtual void put_integrity_stamp(const IntegrityStamp &stamp) = 0;

  // Oldest first
  virtual Page<LogRecord> query_records(const TimeRange &range,
                                        const RecordFilter &filter,
                                        const PageRequest &page) const = 0;

  // Newest first, at most `limit`
  virtual std::vector<Alert> query_alerts(const TimeRange &range, size_t limit,
                                          const AlertFilter &filter) const = 0;

  virtual std::vector<IntegrityStamp> integrity_stamps() const = 0;

  virtual size_t record_count() const = 0;
};

#endif // RECORD_STORE_HPP
