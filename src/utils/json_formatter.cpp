#include "json_formatter.hpp"
#include "utils.hpp"

namespace {

// Time fields carry both forms: epoch millis for machines, ISO 8601 for people
void put_time(nlohmann::json &j, const char *key, uint64_t timestamp_ms) {
  j[std::string(key) + "_ms"] = timestamp_ms;
  j[key] = Utils::format_iso8601_ms(timestamp_ms);
}

} // namespace

nlohmann::json JsonFormatter::record_to_json_object(const LogRecord &record) {
  nlohmann::json j;
  j["id"] = record.record_id();
  put_time(j, "timestamp", record.timestamp_ms);
  j["client_ip"] = record.client_ip;
  j["method"] = record.method;
  j["path"] = record.path;
  j["query"] = record.query;
  j["protocol_version"] = record.protocol_version;
  j["status_code"] = record.status_code;
  j["bytes_sent"] = record.bytes_sent;
  j["referrer"] = record.referrer;
  j["user_agent"] = record.user_agent;
  if (record.response_time_ms)
    j["response_time_ms"] = *record.response_time_ms;
  else
    j["response_time_ms"] = nullptr;
  j["source_file_id"] = record.source_file_id;
  j["line_offset"] = record.line_offset;
  j["format"] = record.format_name;
  j["extra_fields"] = record.extra_fields;

  if (record.enrichment) {
    const auto &e = *record.enrichment;
    nlohmann::json enrichment;
    enrichment["country"] = e.country;
    enrichment["ua_class"] = ua_class_to_string(e.ua_class);
    enrichment["browser_family"] = e.browser_family;
    if (e.browser_major_version)
      enrichment["browser_major_version"] = *e.browser_major_version;
    enrichment["is_local_address"] = e.is_local_address;
    j["enrichment"] = enrichment;
  }
  return j;
}

nlohmann::json JsonFormatter::alert_to_json_object(const Alert &alert) {
  nlohmann::json j;
  j["id"] = alert.id;
  put_time(j, "timestamp", alert.timestamp_ms);
  j["attack_type"] = attack_type_to_string(alert.attack_type);
  j["client_ip"] = alert.client_ip;
  j["endpoint"] = alert.endpoint;
  j["confidence"] = alert.confidence;
  j["evidence"] = alert.evidence;
  j["source_record_ids"] = alert.source_record_ids;
  j["trigger_count"] = alert.trigger_count;
  put_time(j, "last_trigger", alert.last_trigger_ms);
  return j;
}

nlohmann::json JsonFormatter::bucket_to_json_object(const MetricsBucket &bucket) {
  nlohmann::json j;
  j["granularity"] = granularity_to_string(bucket.granularity);
  put_time(j, "bucket_start", bucket.bucket_start_ms);
  j["request_count"] = bucket.request_count;
  j["error_count"] = bucket.error_count;
  j["bytes_total"] = bucket.bytes_total;
  j["unique_client_count"] = bucket.unique_client_count;
  j["status_2xx"] = bucket.status_2xx;
  j["status_3xx"] = bucket.status_3xx;
  j["status_4xx"] = bucket.status_4xx;
  j["status_5xx"] = bucket.status_5xx;
  return j;
}

nlohmann::json
JsonFormatter::summary_to_json_object(const TrafficSummary &summary) {
  nlohmann::json j;
  put_time(j, "from", summary.range.from_ms);
  put_time(j, "to", summary.range.to_ms);
  j["request_count"] = summary.request_count;
  j["error_count"] = summary.error_count;
  j["bytes_total"] = summary.bytes_total;
  j["unique_client_count"] = summary.unique_client_count;
  j["status_2xx"] = summary.status_2xx;
  j["status_3xx"] = summary.status_3xx;
  j["status_4xx"] = summary.status_4xx;
  j["status_5xx"] = summary.status_5xx;
  j["method_counts"] = summary.method_counts;
  return j;
}

nlohmann::json JsonFormatter::top_entry_to_json_object(const TopEntry &entry) {
  return {{"key", entry.key}, {"count", entry.count}, {"error", entry.error}};
}

nlohmann::json
JsonFormatter::batch_summary_to_json_object(const BatchSummary &summary) {
  nlohmann::json j;
  j["source_file_id"] = summary.source_file_id;
  j["lines_total"] = summary.lines_total;
  j["parsed_ok"] = summary.parsed_ok;
  j["parse_errors"] = summary.parse_errors;
  nlohmann::json by_kind = nlohmann::json::object();
  for (const auto &[kind, count] : summary.parse_errors_by_kind)
    by_kind[parse_error_kind_to_string(kind)] = count;
  j["parse_errors_by_kind"] = by_kind;
  j["blank_lines"] = summary.blank_lines;
  j["storage_failures"] = summary.storage_failures;
  j["alert_storage_failures"] = summary.alert_storage_failures;
  if (summary.first_unacknowledged_offset)
    j["first_unacknowledged_offset"] = *summary.first_unacknowledged_offset;
  else
    j["first_unacknowledged_offset"] = nullptr;
  j["content_hash"] = summary.content_hash;
  j["complete"] = summary.complete;
  if (summary.error)
    j["error"] = error_to_json_object(error_kind_to_string(summary.error->kind),
                                      summary.error->message)["error"];
  else
    j["error"] = nullptr;
  return j;
}

nlohmann::json JsonFormatter::stamp_to_json_object(const IntegrityStamp &stamp) {
  nlohmann::json j;
  j["source_file_id"] = stamp.source_file_id;
  j["sha256"] = stamp.sha256;
  j["bytes_hashed"] = stamp.bytes_hashed;
  j["lines_committed"] = stamp.lines_committed;
  j["complete"] = stamp.complete;
  put_time(j, "stamped_at", stamp.stamped_at_ms);
  return j;
}

nlohmann::json
JsonFormatter::record_page_to_json_object(const Page<LogRecord> &page) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto &record : page.items)
    items.push_back(record_to_json_object(record));
  return {{"items", items},
          {"total_count", page.total_count},
          {"page", page.page},
          {"page_size", page.page_size},
          {"page_count", page.page_count}};
}

nlohmann::json JsonFormatter::live_event_to_json_object(const LiveEvent &event) {
  nlohmann::json j;
  j["type"] = live_event_type_to_string(event.type);
  j["sequence"] = event.sequence;
  if (const auto *record = std::get_if<LogRecord>(&event.payload))
    j["record"] = record_to_json_object(*record);
  else if (const auto *alert = std::get_if<Alert>(&event.payload))
    j["alert"] = alert_to_json_object(*alert);
  return j;
}

nlohmann::json JsonFormatter::error_to_json_object(std::string_view kind,
                                                   std::string_view message) {
  return {{"error", {{"kind", std::string(kind)},
                     {"message", std::string(message)}}}};
}

nlohmann::json JsonFormatter::error_to_json_object(const SentinelError &error) {
  return error_to_json_object(error_kind_to_string(error.kind()), error.what());
}

std::string JsonFormatter::dump(const nlohmann::json &j, int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
