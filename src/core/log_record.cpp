#include "log_record.hpp"

#include <string>
#include <tuple>

const char *parse_error_kind_to_string(ParseErrorKind kind) {
  switch (kind) {
  case ParseErrorKind::UnmatchedFormat:
    return "UnmatchedFormat";
  case ParseErrorKind::InvalidTimestamp:
    return "InvalidTimestamp";
  case ParseErrorKind::InvalidStatusCode:
    return "InvalidStatusCode";
  case ParseErrorKind::TruncatedLine:
    return "TruncatedLine";
  case ParseErrorKind::MissingField:
    return "MissingField";
  case ParseErrorKind::InvalidFieldValue:
    return "InvalidFieldValue";
  }
  return "Unknown";
}

const char *ua_class_to_string(UaClass ua_class) {
  switch (ua_class) {
  case UaClass::Browser:
    return "Browser";
  case UaClass::Bot:
    return "Bot";
  case UaClass::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

bool Enrichment::operator==(const Enrichment &other) const {
  return std::tie(country, ua_class, browser_family, browser_major_version,
                  is_local_address) ==
         std::tie(other.country, other.ua_class, other.browser_family,
                  other.browser_major_version, other.is_local_address);
}

std::string LogRecord::record_id() const {
  return source_file_id + ":" + std::to_string(line_offset);
}

bool LogRecord::operator==(const LogRecord &other) const {
  return std::tie(timestamp_ms, client_ip, method, path, query,
                  protocol_version, status_code, bytes_sent, referrer,
                  user_agent, response_time_ms, source_file_id, line_offset,
                  format_name, extra_fields, enrichment) ==
         std::tie(other.timestamp_ms, other.client_ip, other.method, other.path,
                  other.query, other.protocol_version, other.status_code,
                  other.bytes_sent, other.referrer, other.user_agent,
                  other.response_time_ms, other.source_file_id,
                  other.line_offset, other.format_name, other.extra_fields,
                  other.enrichment);
}
