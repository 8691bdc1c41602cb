#ifndef TIME_BUCKETS_HPP
#define TIME_BUCKETS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

enum class Granularity { Hour, Day, Week, Month };

constexpr size_t GRANULARITY_COUNT = 4;

const char *granularity_to_string(Granularity granularity);
std::optional<Granularity> granularity_from_string(std::string_view name);

// UTC start of the bucket holding `timestamp_ms`. Weeks start on Monday.
uint64_t bucket_start(uint64_t timestamp_ms, Granularity granularity);

// Start of the bucket after the one starting at `start_ms`
uint64_t next_bucket_start(uint64_t start_ms, Granularity granularity);

#endif // TIME_BUCKETS_HPP
