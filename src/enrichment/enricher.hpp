#ifndef ENRICHER_HPP
#define ENRICHER_HPP

#include "core/config.hpp"
#include "core/log_record.hpp"
#include "geo_lookup.hpp"
#include "ua_classifier.hpp"

#include <prometheus/counter.h>

#include <atomic>
#include <cstdint>
#include <memory>

// Attaches country and user-agent class to a record. Lookup failures never
// escape: the record gets "Unknown" and the failure is counted.
class Enricher {
public:
  Enricher(std::shared_ptr<GeoLookup> geo_lookup,
           std::shared_ptr<const UaClassifier> ua_classifier);

  // Builds the lookups named by the [Enrichment] section. A geo source that
  // cannot be set up is logged and left out.
  static std::shared_ptr<Enricher>
  from_config(const Config::EnrichmentConfig &config);

  LogRecord enrich(LogRecord record) const;

  uint64_t lookup_failures() const { return lookup_failures_.load(); }

private:
  std::shared_ptr<GeoLookup> geo_lookup_;
  std::shared_ptr<const UaClassifier> ua_classifier_;

  mutable std::atomic<uint64_t> lookup_failures_{0};
  prometheus::Counter &failures_counter_;
};

#endif // ENRICHER_HPP
