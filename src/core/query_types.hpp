#ifndef QUERY_TYPES_HPP
#define QUERY_TYPES_HPP

#include "alert.hpp"
#include "log_record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Half-open [from_ms, to_ms)
struct TimeRange {
  uint64_t from_ms = 0;
  uint64_t to_ms = 0;

  bool contains(uint64_t timestamp_ms) const {
    return timestamp_ms >= from_ms && timestamp_ms < to_ms;
  }
};

struct RecordFilter {
  std::optional<std::string> client_ip;
  std::optional<int> status_code;
  std::optional<std::string> endpoint_contains;
  std::optional<std::string> method;

  bool matches(const LogRecord &record) const;
};

struct AlertFilter {
  std::optional<AttackType> attack_type;
  std::optional<std::string> client_ip;
  std::optional<double> min_confidence;

  bool matches(const Alert &alert) const;
};

// 1-based page number
struct PageRequest {
  size_t page = 1;
  size_t page_size = 100;
};

template <typename T> struct Page {
  std::vector<T> items;
  size_t total_count = 0;
  size_t page = 1;
  size_t page_size = 0;
  size_t page_count = 0;
};

inline size_t page_count_for(size_t total_count, size_t page_size) {
  return page_size == 0 ? 0 : (total_count + page_size - 1) / page_size;
}

#endif // QUERY_TYPES_HPP
