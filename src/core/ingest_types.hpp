#ifndef INGEST_TYPES_HPP
#define INGEST_TYPES_HPP

#include "errors.hpp"
#include "log_record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Content hash over the accepted prefix of one source
struct IntegrityStamp {
  std::string source_file_id;
  std::string sha256;
  uint64_t bytes_hashed = 0;
  uint64_t lines_committed = 0;
  bool complete = false;
  uint64_t stamped_at_ms = 0;
};

struct StructuredError {
  ErrorKind kind = ErrorKind::SourceUnreadable;
  std::string message;
};

// Outcome of ingesting one source. Line offsets are 1-based line numbers.
struct BatchSummary {
  std::string source_file_id;
  uint64_t lines_total = 0;
  uint64_t parsed_ok = 0;
  uint64_t parse_errors = 0;
  std::map<ParseErrorKind, uint64_t> parse_errors_by_kind;
  uint64_t blank_lines = 0;
  uint64_t storage_failures = 0;
  // Alerts derived from this source that the store rejected
  uint64_t alert_storage_failures = 0;
  // Earliest line whose record or alert was not persisted; retry from here
  std::optional<uint64_t> first_unacknowledged_offset;
  std::string content_hash;
  bool complete = false;
  std::optional<StructuredError> error;
};

#endif // INGEST_TYPES_HPP
