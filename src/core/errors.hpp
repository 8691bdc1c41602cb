#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Stable error kinds reported at every boundary of the pipeline
enum class ErrorKind {
  ParseError,
  EnrichmentLookupFailure,
  ClassifierConfigError,
  StorageWriteFailure,
  CapacityExceeded,
  SourceUnreadable,
  InvalidQuery
};

const char *error_kind_to_string(ErrorKind kind);

class SentinelError : public std::runtime_error {
public:
  SentinelError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class ClassifierConfigError : public SentinelError {
public:
  explicit ClassifierConfigError(const std::string &message)
      : SentinelError(ErrorKind::ClassifierConfigError, message) {}

  ClassifierConfigError(const std::string &message,
                        std::vector<std::string> details)
      : SentinelError(ErrorKind::ClassifierConfigError, message),
        details_(std::move(details)) {}

  const std::vector<std::string> &details() const { return details_; }

private:
  std::vector<std::string> details_;
};

class StorageError : public SentinelError {
public:
  explicit StorageError(const std::string &message)
      : SentinelError(ErrorKind::StorageWriteFailure, message) {}
};

class EnrichmentLookupError : public SentinelError {
public:
  explicit EnrichmentLookupError(const std::string &message)
      : SentinelError(ErrorKind::EnrichmentLookupFailure, message) {}
};

class SourceUnreadableError : public SentinelError {
public:
  explicit SourceUnreadableError(const std::string &message)
      : SentinelError(ErrorKind::SourceUnreadable, message) {}
};

class QueryError : public SentinelError {
public:
  explicit QueryError(const std::string &message)
      : SentinelError(ErrorKind::InvalidQuery, message) {}
};

#endif // ERRORS_HPP
