#include "geo_lookup.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <regex>

CidrGeoLookup::CidrGeoLookup(
    const std::vector<std::pair<std::string, std::string>> &entries) {
  for (const auto &[cidr, country] : entries) {
    auto block = Utils::parse_cidr(cidr);
    if (!block) {
      LOG(LogLevel::WARN, LogComponent::ENRICHMENT,
          "Skipping invalid CIDR '" << cidr << "' in geo table");
      continue;
    }
    blocks_.push_back(Entry{*block, country});
  }
  std::stable_sort(blocks_.begin(), blocks_.end(),
                   [](const Entry &a, const Entry &b) {
                     return a.block.prefix_length > b.block.prefix_length;
                   });
}

std::unique_ptr<CidrGeoLookup>
CidrGeoLookup::from_csv_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw EnrichmentLookupError("Cannot open geo CIDR table: " + path);

  std::vector<std::pair<std::string, std::string>> entries;
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = Utils::trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;
    size_t comma = trimmed.find(',');
    if (comma == std::string::npos)
      continue;
    entries.emplace_back(Utils::trim_copy(trimmed.substr(0, comma)),
                         Utils::trim_copy(trimmed.substr(comma + 1)));
  }

  auto lookup = std::make_unique<CidrGeoLookup>(entries);
  LOG(LogLevel::INFO, LogComponent::ENRICHMENT,
      "Loaded " << lookup->size() << " geo CIDR blocks from " << path);
  return lookup;
}

std::optional<std::string> CidrGeoLookup::country_for(const std::string &ip) {
  auto address = Utils::ip_string_to_uint32(ip);
  if (!address)
    return std::nullopt;
  for (const auto &entry : blocks_)
    if (entry.block.contains(*address))
      return entry.country;
  return std::nullopt;
}

HttpGeoLookup::HttpGeoLookup(const std::string &endpoint_url,
                             uint64_t timeout_ms, size_t cache_size,
                             size_t failure_threshold, uint64_t cooldown_ms)
    : timeout_ms_(timeout_ms), cache_size_(cache_size),
      breaker_("geo_lookup",
               CircuitBreaker::Config{failure_threshold,
                                      std::chrono::milliseconds(cooldown_ms)}) {
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;
  if (!std::regex_match(endpoint_url, match, url_regex))
    throw EnrichmentLookupError("Invalid geo lookup endpoint: " +
                                endpoint_url);
  base_url_ = match[1].str() + "://" + match[2].str();
  path_template_ = match[3].matched ? match[3].str() : "/";
}

std::optional<std::optional<std::string>>
HttpGeoLookup::cached(const std::string &ip) const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  auto it = cache_.find(ip);
  if (it == cache_.end())
    return std::nullopt;
  return it->second;
}

void HttpGeoLookup::remember(const std::string &ip,
                             const std::optional<std::string> &value) {
  if (cache_size_ == 0)
    return;
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (!cache_.emplace(ip, value).second)
    return;
  cache_order_.push_back(ip);
  while (cache_order_.size() > cache_size_) {
    cache_.erase(cache_order_.front());
    cache_order_.pop_front();
  }
}

size_t HttpGeoLookup::cached_entries() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

std::optional<std::string> HttpGeoLookup::country_for(const std::string &ip) {
  if (auto hit = cached(ip))
    return *hit;

  // Unavailable service reads as an uncovered address until the cooldown ends
  if (!breaker_.allow_request())
    return std::nullopt;

  auto country = query(ip);
  breaker_.record_success();
  remember(ip, country);
  return country;
}

void HttpGeoLookup::fail(const std::string &message) {
  if (breaker_.record_failure())
    LOG(LogLevel::WARN, LogComponent::ENRICHMENT,
        "Geo lookup service unavailable, pausing lookups: " << message);
  throw EnrichmentLookupError(message);
}

std::optional<std::string> HttpGeoLookup::query(const std::string &ip) {
  std::string path = path_template_;
  size_t placeholder = path.find("{ip}");
  if (placeholder != std::string::npos)
    path.replace(placeholder, 4, ip);
  else
    path += ip;

  httplib::Client client(base_url_);
  client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
  client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

  auto res = client.Get(path.c_str());
  if (!res)
    fail("Geo lookup for " + ip + " failed: " +
         httplib::to_string(res.error()));
  if (res->status == 404)
    return std::nullopt;
  if (res->status != 200)
    fail("Geo lookup for " + ip + " returned status " +
         std::to_string(res->status));

  auto body = nlohmann::json::parse(res->body, nullptr, false);
  if (body.is_discarded() || !body.is_object())
    fail("Geo lookup for " + ip + " returned malformed JSON");

  for (const char *key : {"country", "country_code"}) {
    auto it = body.find(key);
    if (it != body.end() && it->is_string() && !it->get<std::string>().empty())
      return it->get<std::string>();
  }
  return std::nullopt;
}
