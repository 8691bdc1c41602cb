#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/metrics_aggregator.hpp"
#include "core/alert.hpp"
#include "core/errors.hpp"
#include "core/ingest_types.hpp"
#include "core/log_record.hpp"
#include "core/query_types.hpp"
#include "io/live/live_channel.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace JsonFormatter {

nlohmann::json record_to_json_object(const LogRecord &record);
nlohmann::json alert_to_json_object(const Alert &alert);
nlohmann::json bucket_to_json_object(const MetricsBucket &bucket);
nlohmann::json summary_to_json_object(const TrafficSummary &summary);
nlohmann::json top_entry_to_json_object(const TopEntry &entry);
nlohmann::json batch_summary_to_json_object(const BatchSummary &summary);
nlohmann::json stamp_to_json_object(const IntegrityStamp &stamp);
nlohmann::json record_page_to_json_object(const Page<LogRecord> &page);
nlohmann::json live_event_to_json_object(const LiveEvent &event);

// {"error":{"kind":...,"message":...}}
nlohmann::json error_to_json_object(std::string_view kind,
                                    std::string_view message);
nlohmann::json error_to_json_object(const SentinelError &error);

// Serializes with invalid UTF-8 replaced; log lines are not guaranteed to be
// valid UTF-8
std::string dump(const nlohmann::json &j, int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
