#include "mongo_record_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/replace.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>

using bsoncxx::builder::basic::kvp;

namespace {

constexpr const char *RECORDS_COLLECTION = "records";
constexpr const char *ALERTS_COLLECTION = "alerts";
constexpr const char *INTEGRITY_COLLECTION = "integrity";

bsoncxx::types::b_date to_date(uint64_t timestamp_ms) {
  return bsoncxx::types::b_date(
      std::chrono::milliseconds(static_cast<int64_t>(timestamp_ms)));
}

std::string get_string(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (element && element.type() == bsoncxx::type::k_string)
    return std::string(element.get_string().value);
  return "";
}

int64_t get_int(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (!element)
    return 0;
  switch (element.type()) {
  case bsoncxx::type::k_int64:
    return element.get_int64().value;
  case bsoncxx::type::k_int32:
    return element.get_int32().value;
  case bsoncxx::type::k_double:
    return static_cast<int64_t>(element.get_double().value);
  case bsoncxx::type::k_date:
    return element.get_date().to_int64();
  default:
    return 0;
  }
}

double get_double(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  if (element && element.type() == bsoncxx::type::k_double)
    return element.get_double().value;
  return static_cast<double>(get_int(doc, key));
}

bool get_bool(const bsoncxx::document::view &doc, const char *key) {
  auto element = doc[key];
  return element && element.type() == bsoncxx::type::k_bool &&
         element.get_bool().value;
}

std::string escape_regex(std::string_view text) {
  std::string escaped;
  for (char c : text) {
    if (std::string_view("\\^$.|?*+()[]{}").find(c) != std::string_view::npos)
      escaped.push_back('\\');
    escaped.push_back(c);
  }
  return escaped;
}

bsoncxx::document::value time_range_filter(const TimeRange &range) {
  bsoncxx::builder::basic::document range_builder{};
  range_builder.append(kvp("$gte", to_date(range.from_ms)));
  range_builder.append(kvp("$lt", to_date(range.to_ms)));
  return range_builder.extract();
}

bsoncxx::document::value record_to_bson(const LogRecord &record) {
  bsoncxx::builder::basic::document doc{};
  doc.append(kvp("_id", record.record_id()));
  doc.append(kvp("timestamp", to_date(record.timestamp_ms)));
  doc.append(kvp("client_ip", record.client_ip));
  doc.append(kvp("method", record.method));
  doc.append(kvp("path", record.path));
  doc.append(kvp("endpoint", record.endpoint()));
  doc.append(kvp("query", record.query));
  doc.append(kvp("protocol_version", record.protocol_version));
  doc.append(kvp("status_code", static_cast<int32_t>(record.status_code)));
  doc.append(kvp("bytes_sent", static_cast<int64_t>(record.bytes_sent)));
  doc.append(kvp("referrer", record.referrer));
  doc.append(kvp("user_agent", record.user_agent));
  if (record.response_time_ms)
    doc.append(kvp("response_time_ms", *record.response_time_ms));
  doc.append(kvp("source_file_id", record.source_file_id));
  doc.append(kvp("line_offset", static_cast<int64_t>(record.line_offset)));
  doc.append(kvp("format_name", record.format_name));

  bsoncxx::builder::basic::document extras{};
  for (const auto &[key, value] : record.extra_fields)
    extras.append(kvp(key, value));
  doc.append(kvp("extra_fields", extras.extract()));

  if (record.enrichment) {
    const Enrichment &e = *record.enrichment;
    bsoncxx::builder::basic::document enrichment{};
    enrichment.append(kvp("country", e.country));
    enrichment.append(kvp("ua_class", ua_class_to_string(e.ua_class)));
    enrichment.append(kvp("browser_family", e.browser_family));
    if (e.browser_major_version)
      enrichment.append(
          kvp("browser_major_version",
              static_cast<int32_t>(*e.browser_major_version)));
    enrichment.append(kvp("is_local_address", e.is_local_address));
    doc.append(kvp("enrichment", enrichment.extract()));
  }
  return doc.extract();
}

LogRecord record_from_bson(const bsoncxx::document::view &doc) {
  LogRecord record;
  record.timestamp_ms = static_cast<uint64_t>(get_int(doc, "timestamp"));
  record.client_ip = get_string(doc, "client_ip");
  record.method = get_string(doc, "method");
  record.path = get_string(doc, "path");
  record.query = get_string(doc, "query");
  record.protocol_version = get_string(doc, "protocol_version");
  record.status_code = static_cast<int>(get_int(doc, "status_code"));
  record.bytes_sent = static_cast<uint64_t>(get_int(doc, "bytes_sent"));
  record.referrer = get_string(doc, "referrer");
  record.user_agent = get_string(doc, "user_agent");
  if (doc["response_time_ms"])
    record.response_time_ms = get_double(doc, "response_time_ms");
  record.source_file_id = get_string(doc, "source_file_id");
  record.line_offset = static_cast<uint64_t>(get_int(doc, "line_offset"));
  record.format_name = get_string(doc, "format_name");

  auto extras = doc["extra_fields"];
  if (extras && extras.type() == bsoncxx::type::k_document)
    for (const auto &element : extras.get_document().value)
      if (element.type() == bsoncxx::type::k_string)
        record.extra_fields[std::string(element.key())] =
            std::string(element.get_string().value);

  auto enrichment_element = doc["enrichment"];
  if (enrichment_element &&
      enrichment_element.type() == bsoncxx::type::k_document) {
    auto view = enrichment_element.get_document().value;
    Enrichment e;
    e.country = get_string(view, "country");
    std::string ua_class = get_string(view, "ua_class");
    e.ua_class = ua_class == "Browser" ? UaClass::Browser
                 : ua_class == "Bot"   ? UaClass::Bot
                                       : UaClass::Unknown;
    e.browser_family = get_string(view, "browser_family");
    if (view["browser_major_version"])
      e.browser_major_version =
          static_cast<int>(get_int(view, "browser_major_version"));
    e.is_local_address = get_bool(view, "is_local_address");
    record.enrichment = std::move(e);
  }
  return record;
}

bsoncxx::document::value alert_to_bson(const Alert &alert) {
  bsoncxx::builder::basic::document doc{};
  doc.append(kvp("_id", alert.id));
  doc.append(kvp("timestamp", to_date(alert.timestamp_ms)));
  doc.append(kvp("attack_type", attack_type_to_string(alert.attack_type)));
  doc.append(kvp("client_ip", alert.client_ip));
  doc.append(kvp("endpoint", alert.endpoint));
  doc.append(kvp("confidence", alert.confidence));
  doc.append(kvp("evidence", alert.evidence));
  bsoncxx::builder::basic::array ids{};
  for (const auto &id : alert.source_record_ids)
    ids.append(id);
  doc.append(kvp("source_record_ids", ids.extract()));
  doc.append(kvp("trigger_count", static_cast<int64_t>(alert.trigger_count)));
  doc.append(kvp("last_trigger", to_date(alert.last_trigger_ms)));
  return doc.extract();
}

Alert alert_from_bson(const bsoncxx::document::view &doc) {
  Alert alert;
  alert.id = get_string(doc, "_id");
  alert.timestamp_ms = static_cast<uint64_t>(get_int(doc, "timestamp"));
  alert.attack_type = attack_type_from_string(get_string(doc, "attack_type"))
                          .value_or(AttackType::SQLInjection);
  alert.client_ip = get_string(doc, "client_ip");
  alert.endpoint = get_string(doc, "endpoint");
  alert.confidence = get_double(doc, "confidence");
  alert.evidence = get_string(doc, "evidence");
  auto ids = doc["source_record_ids"];
  if (ids && ids.type() == bsoncxx::type::k_array)
    for (const auto &element : ids.get_array().value)
      if (element.type() == bsoncxx::type::k_string)
        alert.source_record_ids.emplace_back(element.get_string().value);
  alert.trigger_count = static_cast<uint64_t>(get_int(doc, "trigger_count"));
  alert.last_trigger_ms = static_cast<uint64_t>(get_int(doc, "last_trigger"));
  return alert;
}

void replace_by_id(mongocxx::collection collection, const std::string &id,
                   const bsoncxx::document::view &replacement) {
  bsoncxx::builder::basic::document filter{};
  filter.append(kvp("_id", id));
  mongocxx::options::replace opts{};
  opts.upsert(true);
  collection.replace_one(filter.view(), replacement, opts);
}

} // namespace

MongoRecordStore::MongoRecordStore(std::shared_ptr<MongoManager> manager)
    : mongo_manager_(std::move(manager)),
      database_(mongo_manager_->database_name()) {}

void MongoRecordStore::ensure_indexes() {
  try {
    auto client = mongo_manager_->get_client();
    auto db = (*client)[database_];
    for (const char *name : {RECORDS_COLLECTION, ALERTS_COLLECTION}) {
      bsoncxx::builder::basic::document keys{};
      keys.append(kvp("timestamp", 1));
      db[name].create_index(keys.view());
    }
    // Per-client drill-down in the records view
    bsoncxx::builder::basic::document client_keys{};
    client_keys.append(kvp("client_ip", 1), kvp("timestamp", 1));
    db[RECORDS_COLLECTION].create_index(client_keys.view());
    LOG(LogLevel::DEBUG, LogComponent::IO_STORE,
        "MongoDB indexes ensured on database " << database_);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_STORE,
        "Could not create MongoDB indexes: " << e.what());
  }
}

void MongoRecordStore::append_record(const LogRecord &record) {
  try {
    auto client = mongo_manager_->get_client();
    auto doc = record_to_bson(record);
    replace_by_id((*client)[database_][RECORDS_COLLECTION], record.record_id(),
                  doc.view());
  } catch (const std::exception &e) {
    throw StorageError("Failed to store record " + record.record_id() + ": " +
                       e.what());
  }
}

void MongoRecordStore::upsert_alert(const Alert &alert) {
  try {
    auto client = mongo_manager_->get_client();
    auto doc = alert_to_bson(alert);
    replace_by_id((*client)[database_][ALERTS_COLLECTION], alert.id,
                  doc.view());
  } catch (const std::exception &e) {
    throw StorageError("Failed to store alert " + alert.id + ": " + e.what());
  }
}

void MongoRecordStore::put_integrity_stamp(const IntegrityStamp &stamp) {
  try {
    bsoncxx::builder::basic::document doc{};
    doc.append(kvp("_id", stamp.source_file_id));
    doc.append(kvp("sha256", stamp.sha256));
    doc.append(kvp("bytes_hashed", static_cast<int64_t>(stamp.bytes_hashed)));
    doc.append(
        kvp("lines_committed", static_cast<int64_t>(stamp.lines_committed)));
    doc.append(kvp("complete", stamp.complete));
    doc.append(kvp("stamped_at", to_date(stamp.stamped_at_ms)));

    auto client = mongo_manager_->get_client();
    replace_by_id((*client)[database_][INTEGRITY_COLLECTION],
                  stamp.source_file_id, doc.view());
  } catch (const std::exception &e) {
    throw StorageError("Failed to store integrity stamp for " +
                       stamp.source_file_id + ": " + e.what());
  }
}

Page<LogRecord> MongoRecordStore::query_records(const TimeRange &range,
                                                const RecordFilter &filter,
                                                const PageRequest &page) const {
  Page<LogRecord> result;
  result.page = page.page;
  result.page_size = page.page_size;

  bsoncxx::builder::basic::document query{};
  query.append(kvp("timestamp", time_range_filter(range)));
  if (filter.client_ip)
    query.append(kvp("client_ip", *filter.client_ip));
  if (filter.status_code)
    query.append(kvp("status_code", static_cast<int32_t>(*filter.status_code)));
  if (filter.method)
    query.append(kvp("method", *filter.method));
  if (filter.endpoint_contains) {
    bsoncxx::builder::basic::document regex{};
    regex.append(kvp("$regex", escape_regex(*filter.endpoint_contains)));
    query.append(kvp("endpoint", regex.extract()));
  }

  try {
    auto client = mongo_manager_->get_client();
    auto collection = (*client)[database_][RECORDS_COLLECTION];

    result.total_count =
        static_cast<size_t>(collection.count_documents(query.view()));

    mongocxx::options::find opts{};
    bsoncxx::builder::basic::document sort{};
    sort.append(kvp("timestamp", 1));
    sort.append(kvp("_id", 1));
    opts.sort(sort.view());
    opts.skip(static_cast<int64_t>((page.page > 0 ? page.page - 1 : 0) *
                                   page.page_size));
    opts.limit(static_cast<int64_t>(page.page_size));

    for (const auto &doc : collection.find(query.view(), opts))
      result.items.push_back(record_from_bson(doc));
  } catch (const std::exception &e) {
    throw StorageError(std::string("Record query failed: ") + e.what());
  }

  result.page_count = page_count_for(result.total_count, page.page_size);
  return result;
}

std::vector<Alert> MongoRecordStore::query_alerts(const TimeRange &range,
                                                  size_t limit,
                                                  const AlertFilter &filter) const {
  std::vector<Alert> result;

  bsoncxx::builder::basic::document query{};
  query.append(kvp("timestamp", time_range_filter(range)));
  if (filter.attack_type)
    query.append(
        kvp("attack_type", attack_type_to_string(*filter.attack_type)));
  if (filter.client_ip)
    query.append(kvp("client_ip", *filter.client_ip));
  if (filter.min_confidence) {
    bsoncxx::builder::basic::document min{};
    min.append(kvp("$gte", *filter.min_confidence));
    query.append(kvp("confidence", min.extract()));
  }

  try {
    auto client = mongo_manager_->get_client();
    mongocxx::options::find opts{};
    bsoncxx::builder::basic::document sort{};
    sort.append(kvp("timestamp", -1));
    sort.append(kvp("_id", -1));
    opts.sort(sort.view());
    opts.limit(static_cast<int64_t>(limit));

    for (const auto &doc :
         (*client)[database_][ALERTS_COLLECTION].find(query.view(), opts))
      result.push_back(alert_from_bson(doc));
  } catch (const std::exception &e) {
    throw StorageError(std::string("Alert query failed: ") + e.what());
  }
  return result;
}

std::vector<IntegrityStamp> MongoRecordStore::integrity_stamps() const {
  std::vector<IntegrityStamp> result;
  try {
    auto client = mongo_manager_->get_client();
    bsoncxx::builder::basic::document all{};
    for (const auto &doc :
         (*client)[database_][INTEGRITY_COLLECTION].find(all.view())) {
      IntegrityStamp stamp;
      stamp.source_file_id = get_string(doc, "_id");
      stamp.sha256 = get_string(doc, "sha256");
      stamp.bytes_hashed = static_cast<uint64_t>(get_int(doc, "bytes_hashed"));
      stamp.lines_committed =
          static_cast<uint64_t>(get_int(doc, "lines_committed"));
      stamp.complete = get_bool(doc, "complete");
      stamp.stamped_at_ms = static_cast<uint64_t>(get_int(doc, "stamped_at"));
      result.push_back(std::move(stamp));
    }
  } catch (const std::exception &e) {
    throw StorageError(std::string("Integrity query failed: ") + e.what());
  }
  return result;
}

size_t MongoRecordStore::record_count() const {
  try {
    auto client = mongo_manager_->get_client();
    bsoncxx::builder::basic::document all{};
    return static_cast<size_t>(
        (*client)[database_][RECORDS_COLLECTION].count_documents(all.view()));
  } catch (const std::exception &e) {
    throw StorageError(std::string("Record count failed: ") + e.what());
  }
}
