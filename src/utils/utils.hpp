#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
// Decodes %XX escapes. Malformed escapes are kept verbatim.
std::string url_decode(std::string_view encoded_string,
                       bool plus_as_space = false);

std::string to_lower_copy(std::string_view input);

// Collapses every run of whitespace into a single space
std::string collapse_whitespace(std::string_view input);

uint64_t get_current_time_ms();

// Accepts the access-log time formats handled by the parser:
//   23/May/2025:00:00:35 +0530   (zone optional, UTC assumed)
//   2025-05-23T00:00:35.123+05:30 / Z / +0530
//   2025-05-23 00:00:35
// Returns UTC milliseconds since the epoch, or nullopt if any component is
// out of range.
std::optional<uint64_t> parse_log_timestamp_ms(std::string_view text);

// Epoch seconds as written by nginx $msec ("1716422435.123")
std::optional<uint64_t> parse_epoch_seconds_ms(std::string_view text);

std::string format_iso8601_ms(uint64_t timestamp_ms);

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t year, unsigned month, unsigned day);

struct CivilDate {
  int64_t year;
  unsigned month;
  unsigned day;
};

CivilDate civil_from_days(int64_t days);

struct CIDRBlock {
  uint32_t network_address = 0;
  uint32_t netmask = 0;
  int prefix_length = 0;

  bool contains(uint32_t ip) const;
};

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string);
std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str);

bool is_valid_ip_address(std::string_view ip_str);

// Private, loopback and link-local ranges for both address families
bool is_local_address(std::string_view ip_str);

uint64_t fnv1a_64(std::string_view data);
std::string to_hex(uint64_t value);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
