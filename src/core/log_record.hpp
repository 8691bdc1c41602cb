#ifndef LOG_RECORD_HPP
#define LOG_RECORD_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

enum class ParseErrorKind {
  UnmatchedFormat,
  InvalidTimestamp,
  InvalidStatusCode,
  TruncatedLine,
  MissingField,
  InvalidFieldValue
};

const char *parse_error_kind_to_string(ParseErrorKind kind);

struct ParseError {
  ParseErrorKind kind = ParseErrorKind::UnmatchedFormat;
  std::string detail;
  // Name of the format that was committed to, empty when none matched
  std::string format_name;
};

enum class UaClass { Browser, Bot, Unknown };

const char *ua_class_to_string(UaClass ua_class);

struct Enrichment {
  std::string country = "Unknown";
  UaClass ua_class = UaClass::Unknown;
  std::string browser_family;
  std::optional<int> browser_major_version;
  bool is_local_address = false;

  bool operator==(const Enrichment &other) const;
};

struct LogRecord {
  uint64_t timestamp_ms = 0;
  std::string client_ip;
  std::string method;
  std::string path;  // decoded
  std::string query; // raw
  std::string protocol_version;
  int status_code = 0;
  uint64_t bytes_sent = 0;
  std::string referrer;
  std::string user_agent;
  std::optional<double> response_time_ms;

  std::string source_file_id;
  uint64_t line_offset = 0;

  std::string format_name;
  // Variant data that has no slot in the fixed schema (JSON extras, host, ...)
  std::map<std::string, std::string> extra_fields;

  // Set once by the enrichment stage
  std::optional<Enrichment> enrichment;

  std::string record_id() const;
  std::string endpoint() const { return path.empty() ? "/" : path; }
  int status_class() const { return status_code / 100; }

  bool operator==(const LogRecord &other) const;
  bool operator!=(const LogRecord &other) const { return !(*this == other); }
};

using ParseResult = std::variant<LogRecord, ParseError>;

#endif // LOG_RECORD_HPP
