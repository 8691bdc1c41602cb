#include "errors.hpp"

const char *error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::EnrichmentLookupFailure:
    return "EnrichmentLookupFailure";
  case ErrorKind::ClassifierConfigError:
    return "ClassifierConfigError";
  case ErrorKind::StorageWriteFailure:
    return "StorageWriteFailure";
  case ErrorKind::CapacityExceeded:
    return "CapacityExceeded";
  case ErrorKind::SourceUnreadable:
    return "SourceUnreadable";
  case ErrorKind::InvalidQuery:
    return "InvalidQuery";
  }
  return "Unknown";
}
