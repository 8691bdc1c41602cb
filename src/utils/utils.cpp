#include "utils.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <netinet/in.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool parse_digits(std::string_view text, size_t pos, size_t len, int &out) {
  if (pos + len > text.size())
    return false;
  int value = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return false;
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

int month_from_abbreviation(std::string_view abbrev) {
  static const char *names[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                "jul", "aug", "sep", "oct", "nov", "dec"};
  if (abbrev.size() != 3)
    return 0;
  std::string lower = to_lower_copy(abbrev);
  for (int i = 0; i < 12; ++i)
    if (lower == names[i])
      return i + 1;
  return 0;
}

bool is_leap_year(int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int64_t year, unsigned month) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return days[month - 1];
}

// "" -> 0, "Z" -> 0, "+05:30", "+0530", "-07" -> signed seconds east of UTC
std::optional<int64_t> parse_zone_offset_seconds(std::string_view zone) {
  if (zone.empty() || zone == "Z" || zone == "z")
    return 0;
  if (zone[0] != '+' && zone[0] != '-')
    return std::nullopt;

  int sign = zone[0] == '-' ? -1 : 1;
  std::string_view rest = zone.substr(1);
  int hours = 0, minutes = 0;

  if (rest.size() == 2) {
    if (!parse_digits(rest, 0, 2, hours))
      return std::nullopt;
  } else if (rest.size() == 4) {
    if (!parse_digits(rest, 0, 2, hours) || !parse_digits(rest, 2, 2, minutes))
      return std::nullopt;
  } else if (rest.size() == 5 && rest[2] == ':') {
    if (!parse_digits(rest, 0, 2, hours) || !parse_digits(rest, 3, 2, minutes))
      return std::nullopt;
  } else {
    return std::nullopt;
  }

  if (hours > 14 || minutes > 59)
    return std::nullopt;
  return sign * (hours * 3600 + minutes * 60);
}

struct TimeFields {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int millis = 0;
  int64_t zone_offset_seconds = 0;
};

std::optional<uint64_t> fields_to_epoch_ms(const TimeFields &f) {
  if (f.year < 1970 || f.year > 9999)
    return std::nullopt;
  if (f.month < 1 || f.month > 12)
    return std::nullopt;
  if (f.day < 1 ||
      static_cast<unsigned>(f.day) >
          days_in_month(f.year, static_cast<unsigned>(f.month)))
    return std::nullopt;
  if (f.hour > 23 || f.minute > 59 || f.second > 59)
    return std::nullopt;

  int64_t days = days_from_civil(f.year, static_cast<unsigned>(f.month),
                                 static_cast<unsigned>(f.day));
  int64_t seconds = days * 86400 + f.hour * 3600 + f.minute * 60 + f.second -
                    f.zone_offset_seconds;
  if (seconds < 0)
    return std::nullopt;
  return static_cast<uint64_t>(seconds) * 1000 + static_cast<uint64_t>(f.millis);
}

// 23/May/2025:00:00:35 +0530
std::optional<uint64_t> parse_common_log_time(std::string_view text) {
  if (text.size() < 20 || text[2] != '/' || text[6] != '/' ||
      text[11] != ':' || text[14] != ':' || text[17] != ':')
    return std::nullopt;

  TimeFields f;
  f.month = month_from_abbreviation(text.substr(3, 3));
  if (!parse_digits(text, 0, 2, f.day) || f.month == 0 ||
      !parse_digits(text, 7, 4, f.year) || !parse_digits(text, 12, 2, f.hour) ||
      !parse_digits(text, 15, 2, f.minute) ||
      !parse_digits(text, 18, 2, f.second))
    return std::nullopt;

  std::string_view zone = text.substr(20);
  if (!zone.empty()) {
    if (zone[0] != ' ')
      return std::nullopt;
    zone.remove_prefix(1);
  }
  auto offset = parse_zone_offset_seconds(zone);
  if (!offset)
    return std::nullopt;
  f.zone_offset_seconds = *offset;
  return fields_to_epoch_ms(f);
}

// 2025-05-23T00:00:35.123+05:30 and 2025-05-23 00:00:35
std::optional<uint64_t> parse_iso_time(std::string_view text) {
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
      text[16] != ':')
    return std::nullopt;

  TimeFields f;
  if (!parse_digits(text, 0, 4, f.year) || !parse_digits(text, 5, 2, f.month) ||
      !parse_digits(text, 8, 2, f.day) || !parse_digits(text, 11, 2, f.hour) ||
      !parse_digits(text, 14, 2, f.minute) ||
      !parse_digits(text, 17, 2, f.second))
    return std::nullopt;

  size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    int millis = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3)
        millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0 || digits > 9)
      return std::nullopt;
    for (size_t d = digits; d < 3; ++d)
      millis *= 10;
    f.millis = millis;
  }

  std::string_view zone = text.substr(pos);
  if (!zone.empty() && zone[0] == ' ')
    zone.remove_prefix(1);
  auto offset = parse_zone_offset_seconds(zone);
  if (!offset)
    return std::nullopt;
  f.zone_offset_seconds = *offset;
  return fields_to_epoch_ms(f);
}

} // namespace

std::string url_decode(std::string_view encoded_string, bool plus_as_space) {
  std::string decoded;
  decoded.reserve(encoded_string.size());

  for (size_t i = 0; i < encoded_string.size(); ++i) {
    char c = encoded_string[i];
    if (c == '%' && i + 2 < encoded_string.size()) {
      int hi = hex_value(encoded_string[i + 1]);
      int lo = hex_value(encoded_string[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
      decoded.push_back(c);
    } else if (c == '+' && plus_as_space) {
      decoded.push_back(' ');
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

std::string to_lower_copy(std::string_view input) {
  std::string out(input);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

std::string collapse_whitespace(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  bool in_space = false;
  for (char c : input) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space)
        out.push_back(' ');
      in_space = true;
    } else {
      out.push_back(c);
      in_space = false;
    }
  }
  return out;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::optional<uint64_t> parse_log_timestamp_ms(std::string_view text) {
  if (text.empty() || text == "-")
    return std::nullopt;
  if (text.front() == '[' && text.back() == ']')
    text = text.substr(1, text.size() - 2);

  if (text.size() > 2 && text[2] == '/')
    return parse_common_log_time(text);
  if (text.size() > 4 && text[4] == '-')
    return parse_iso_time(text);
  return std::nullopt;
}

std::optional<uint64_t> parse_epoch_seconds_ms(std::string_view text) {
  if (text.empty())
    return std::nullopt;

  size_t dot = text.find('.');
  std::string_view whole = text.substr(0, dot);
  auto seconds = string_to_number<uint64_t>(whole);
  if (!seconds)
    return std::nullopt;

  uint64_t millis = 0;
  if (dot != std::string_view::npos) {
    std::string_view fraction = text.substr(dot + 1);
    if (fraction.empty())
      return std::nullopt;
    size_t digits = 0;
    for (char c : fraction) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return std::nullopt;
      if (digits < 3)
        millis = millis * 10 + static_cast<uint64_t>(c - '0');
      ++digits;
    }
    for (size_t d = digits; d < 3; ++d)
      millis *= 10;
  }
  // Anything past year 9999 is not a plausible log time
  if (*seconds > 253402300799ULL)
    return std::nullopt;
  return *seconds * 1000 + millis;
}

std::string format_iso8601_ms(uint64_t timestamp_ms) {
  int64_t total_seconds = static_cast<int64_t>(timestamp_ms / 1000);
  int64_t days = total_seconds / 86400;
  int64_t seconds_of_day = total_seconds % 86400;
  CivilDate date = civil_from_days(days);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer),
                "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lluZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(seconds_of_day / 3600),
                static_cast<long long>((seconds_of_day % 3600) / 60),
                static_cast<long long>(seconds_of_day % 60),
                static_cast<unsigned long long>(timestamp_ms % 1000));
  return buffer;
}

int64_t days_from_civil(int64_t year, unsigned month, unsigned day) {
  year -= month <= 2;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 +
                       day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civil_from_days(int64_t days) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t year = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned day = doy - (153 * mp + 2) / 5 + 1;
  const unsigned month = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{year + (month <= 2), month, day};
}

bool CIDRBlock::contains(uint32_t ip) const {
  return (ip & netmask) == network_address;
}

std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str) {
  std::string ip(ip_str);
  in_addr addr{};
  if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
    return std::nullopt;
  return ntohl(addr.s_addr);
}

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string) {
  std::string trimmed = trim_copy(cidr_string);
  size_t slash_pos = trimmed.find('/');
  if (slash_pos == std::string::npos) {
    auto ip = ip_string_to_uint32(trimmed);
    if (!ip)
      return std::nullopt;
    return CIDRBlock{*ip, 0xFFFFFFFF, 32};
  }

  auto ip = ip_string_to_uint32(std::string_view(trimmed).substr(0, slash_pos));
  auto mask_len =
      string_to_number<int>(std::string_view(trimmed).substr(slash_pos + 1));
  if (!ip || !mask_len || *mask_len < 0 || *mask_len > 32)
    return std::nullopt;

  uint32_t netmask = (*mask_len == 0) ? 0 : (0xFFFFFFFFu << (32 - *mask_len));
  return CIDRBlock{*ip & netmask, netmask, *mask_len};
}

bool is_valid_ip_address(std::string_view ip_str) {
  if (ip_str.empty() || ip_str.size() > INET6_ADDRSTRLEN)
    return false;
  std::string ip(ip_str);
  in_addr v4{};
  in6_addr v6{};
  return inet_pton(AF_INET, ip.c_str(), &v4) == 1 ||
         inet_pton(AF_INET6, ip.c_str(), &v6) == 1;
}

namespace {
bool is_local_ipv4(uint32_t ip) {
  return (ip >> 24) == 10 ||                 // 10.0.0.0/8
         (ip >> 20) == ((172u << 4) | 1) ||  // 172.16.0.0/12
         (ip >> 16) == ((192u << 8) | 168) || // 192.168.0.0/16
         (ip >> 24) == 127 ||                 // loopback
         (ip >> 16) == ((169u << 8) | 254);   // link-local
}
} // namespace

bool is_local_address(std::string_view ip_str) {
  if (auto v4 = ip_string_to_uint32(ip_str))
    return is_local_ipv4(*v4);

  std::string ip(ip_str);
  in6_addr v6{};
  if (inet_pton(AF_INET6, ip.c_str(), &v6) != 1)
    return false;

  const unsigned char *b = v6.s6_addr;
  bool loopback = true;
  for (int i = 0; i < 15; ++i)
    loopback = loopback && b[i] == 0;
  if (loopback && b[15] == 1)
    return true;
  if ((b[0] & 0xFE) == 0xFC) // fc00::/7 unique local
    return true;
  if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) // fe80::/10
    return true;

  // ::ffff:a.b.c.d
  bool mapped = true;
  for (int i = 0; i < 10; ++i)
    mapped = mapped && b[i] == 0;
  if (mapped && b[10] == 0xFF && b[11] == 0xFF) {
    uint32_t v4 = (static_cast<uint32_t>(b[12]) << 24) |
                  (static_cast<uint32_t>(b[13]) << 16) |
                  (static_cast<uint32_t>(b[14]) << 8) | b[15];
    return is_local_ipv4(v4);
  }
  return false;
}

uint64_t fnv1a_64(std::string_view data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::string to_hex(uint64_t value) {
  static const char digits[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = digits[value & 0xF];
    value >>= 4;
  }
  return out;
}

} // namespace Utils
