#include "enricher.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <exception>
#include <utility>

namespace {
constexpr const char *LOCAL_COUNTRY = "Local";
constexpr const char *UNKNOWN_COUNTRY = "Unknown";
} // namespace

Enricher::Enricher(std::shared_ptr<GeoLookup> geo_lookup,
                   std::shared_ptr<const UaClassifier> ua_classifier)
    : geo_lookup_(std::move(geo_lookup)),
      ua_classifier_(std::move(ua_classifier)),
      failures_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_enrichment_failures_total",
          "Geo or user-agent lookups that degraded to Unknown")) {}

std::shared_ptr<Enricher>
Enricher::from_config(const Config::EnrichmentConfig &config) {
  std::shared_ptr<GeoLookup> geo;
  try {
    if (!config.geo_http_endpoint.empty())
      geo = std::make_shared<HttpGeoLookup>(config.geo_http_endpoint,
                                            config.geo_http_timeout_ms,
                                            config.geo_cache_size,
                                            config.geo_failure_threshold,
                                            config.geo_cooldown_ms);
    else if (!config.geo_cidr_file.empty())
      geo = CidrGeoLookup::from_csv_file(config.geo_cidr_file);
  } catch (const EnrichmentLookupError &e) {
    LOG(LogLevel::WARN, LogComponent::ENRICHMENT,
        "Geo lookup disabled: " << e.what());
  }

  auto ua = std::make_shared<HeuristicUaClassifier>(config.bot_ua_substrings);
  return std::make_shared<Enricher>(std::move(geo), std::move(ua));
}

LogRecord Enricher::enrich(LogRecord record) const {
  Enrichment enrichment;
  enrichment.is_local_address = Utils::is_local_address(record.client_ip);

  if (enrichment.is_local_address) {
    enrichment.country = LOCAL_COUNTRY;
  } else if (geo_lookup_) {
    try {
      enrichment.country =
          geo_lookup_->country_for(record.client_ip).value_or(UNKNOWN_COUNTRY);
    } catch (const std::exception &e) {
      enrichment.country = UNKNOWN_COUNTRY;
      lookup_failures_++;
      failures_counter_.Increment();
      LOG(LogLevel::DEBUG, LogComponent::ENRICHMENT,
          "Geo lookup failed for " << record.client_ip << ": " << e.what());
    }
  }

  if (ua_classifier_) {
    try {
      UaClassification ua = ua_classifier_->classify(record.user_agent);
      enrichment.ua_class = ua.ua_class;
      enrichment.browser_family = std::move(ua.browser_family);
      enrichment.browser_major_version = ua.browser_major_version;
    } catch (const std::exception &e) {
      enrichment.ua_class = UaClass::Unknown;
      lookup_failures_++;
      failures_counter_.Increment();
      LOG(LogLevel::DEBUG, LogComponent::ENRICHMENT,
          "User agent classification failed: " << e.what());
    }
  }

  record.enrichment = std::move(enrichment);
  return record;
}
