#ifndef MONGO_RECORD_STORE_HPP
#define MONGO_RECORD_STORE_HPP

#include "io/db/mongo_manager.hpp"
#include "record_store.hpp"

#include <memory>
#include <string>

// Collections "records", "alerts" and "integrity" in one database. Documents
// are keyed by record id, alert id and source id, so replays overwrite
// instead of duplicating.
class MongoRecordStore : public IRecordStore {
public:
  explicit MongoRecordStore(std::shared_ptr<MongoManager> manager);

  // Creates the timestamp and client indexes; failures are logged
  void ensure_indexes();

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

private:
  std::shared_ptr<MongoManager> mongo_manager_;
  std::string database_;
};

#endif // MONGO_RECORD_STORE_HPP
