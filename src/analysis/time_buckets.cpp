#include "time_buckets.hpp"
#include "utils/utils.hpp"

namespace {
constexpr uint64_t MS_PER_HOUR = 3600ULL * 1000;
constexpr uint64_t MS_PER_DAY = 24 * MS_PER_HOUR;
// 1970-01-01 was a Thursday
constexpr uint64_t EPOCH_WEEKDAY_FROM_MONDAY = 3;
} // namespace

const char *granularity_to_string(Granularity granularity) {
  switch (granularity) {
  case Granularity::Hour:
    return "hour";
  case Granularity::Day:
    return "day";
  case Granularity::Week:
    return "week";
  case Granularity::Month:
    return "month";
  }
  return "unknown";
}

std::optional<Granularity> granularity_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(name);
  if (lowered == "hour")
    return Granularity::Hour;
  if (lowered == "day")
    return Granularity::Day;
  if (lowered == "week")
    return Granularity::Week;
  if (lowered == "month")
    return Granularity::Month;
  return std::nullopt;
}

uint64_t bucket_start(uint64_t timestamp_ms, Granularity granularity) {
  switch (granularity) {
  case Granularity::Hour:
    return timestamp_ms - timestamp_ms % MS_PER_HOUR;
  case Granularity::Day:
    return timestamp_ms - timestamp_ms % MS_PER_DAY;
  case Granularity::Week: {
    uint64_t days = timestamp_ms / MS_PER_DAY;
    uint64_t weekday = (days + EPOCH_WEEKDAY_FROM_MONDAY) % 7;
    // The first days of 1970 belong to a week that began in 1969
    if (days < weekday)
      return 0;
    return (days - weekday) * MS_PER_DAY;
  }
  case Granularity::Month: {
    auto date = Utils::civil_from_days(
        static_cast<int64_t>(timestamp_ms / MS_PER_DAY));
    return static_cast<uint64_t>(Utils::days_from_civil(date.year, date.month,
                                                        1)) *
           MS_PER_DAY;
  }
  }
  return timestamp_ms;
}

uint64_t next_bucket_start(uint64_t start_ms, Granularity granularity) {
  switch (granularity) {
  case Granularity::Hour:
    return start_ms + MS_PER_HOUR;
  case Granularity::Day:
    return start_ms + MS_PER_DAY;
  case Granularity::Week: {
    uint64_t days = start_ms / MS_PER_DAY;
    uint64_t weekday = (days + EPOCH_WEEKDAY_FROM_MONDAY) % 7;
    return (days + 7 - weekday) * MS_PER_DAY;
  }
  case Granularity::Month: {
    auto date =
        Utils::civil_from_days(static_cast<int64_t>(start_ms / MS_PER_DAY));
    int64_t year = date.year;
    unsigned month = date.month + 1;
    if (month > 12) {
      month = 1;
      ++year;
    }
    return static_cast<uint64_t>(Utils::days_from_civil(year, month, 1)) *
           MS_PER_DAY;
  }
  }
  return start_ms + 1;
}
