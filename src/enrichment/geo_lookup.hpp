#ifndef GEO_LOOKUP_HPP
#define GEO_LOOKUP_HPP

#include "utils/circuit_breaker.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Maps a client address to a country code. Implementations are shared by the
// parse workers and must be safe to call concurrently. `nullopt` means the
// address is not covered; a failed lookup throws EnrichmentLookupError.
class GeoLookup {
public:
  virtual ~GeoLookup() = default;
  virtual std::optional<std::string> country_for(const std::string &ip) = 0;
};

// Static table of IPv4 CIDR blocks answered by longest-prefix match
class CidrGeoLookup : public GeoLookup {
public:
  // (cidr, country) pairs; invalid CIDRs are skipped with a warning
  explicit CidrGeoLookup(
      const std::vector<std::pair<std::string, std::string>> &entries);

  // Reads a "cidr,country" CSV file. '#' starts a comment line.
  static std::unique_ptr<CidrGeoLookup> from_csv_file(const std::string &path);

  std::optional<std::string> country_for(const std::string &ip) override;

  size_t size() const { return blocks_.size(); }

private:
  struct Entry {
    Utils::CIDRBlock block;
    std::string country;
  };

  // Sorted by descending prefix length so the first hit is the longest
  std::vector<Entry> blocks_;
};

// Queries a JSON endpoint such as "http://geo.internal:8080/country/{ip}".
// Without a {ip} placeholder the address is appended. The response must carry
// a "country" or "country_code" string.
//
// After `failure_threshold` consecutive failed requests the service is not
// contacted for `cooldown_ms`; lookups in that period answer nullopt at once.
class HttpGeoLookup : public GeoLookup {
public:
  HttpGeoLookup(const std::string &endpoint_url, uint64_t timeout_ms,
                size_t cache_size, size_t failure_threshold = 5,
                uint64_t cooldown_ms = 30000);

  std::optional<std::string> country_for(const std::string &ip) override;

  size_t cached_entries() const;
  const CircuitBreaker &breaker() const { return breaker_; }

private:
  std::optional<std::optional<std::string>> cached(const std::string &ip) const;
  void remember(const std::string &ip, const std::optional<std::string> &value);
  std::optional<std::string> query(const std::string &ip);
  [[noreturn]] void fail(const std::string &message);

  std::string base_url_;
  std::string path_template_;
  uint64_t timeout_ms_;
  size_t cache_size_;
  CircuitBreaker breaker_;

  mutable std::mutex cache_mutex_;
  std::unordered_map<std::string, std::optional<std::string>> cache_;
  std::deque<std::string> cache_order_;
};

#endif // GEO_LOOKUP_HPP
