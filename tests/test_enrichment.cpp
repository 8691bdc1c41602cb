#include "enrichment/enricher.hpp"
#include "enrichment/geo_lookup.hpp"
#include "enrichment/ua_classifier.hpp"
#include "core/errors.hpp"

#include "httplib.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace {

class ThrowingGeoLookup : public GeoLookup {
public:
  std::optional<std::string> country_for(const std::string &ip) override {
    throw EnrichmentLookupError("lookup backend down for " + ip);
  }
};

LogRecord record_from(const std::string &ip, const std::string &ua = "") {
  LogRecord record;
  record.timestamp_ms = 1672574400000;
  record.client_ip = ip;
  record.path = "/";
  record.status_code = 200;
  record.user_agent = ua;
  return record;
}

} // namespace

TEST(CidrGeoLookupTest, LongestPrefixWins) {
  CidrGeoLookup lookup({{"203.0.0.0/8", "AA"},
                        {"203.0.113.0/24", "BB"},
                        {"not-a-cidr", "ZZ"}});
  EXPECT_EQ(lookup.size(), 2u);
  EXPECT_EQ(lookup.country_for("203.0.113.5"), "BB");
  EXPECT_EQ(lookup.country_for("203.1.2.3"), "AA");
  EXPECT_FALSE(lookup.country_for("198.51.100.1").has_value());
  EXPECT_FALSE(lookup.country_for("garbage").has_value());
}

TEST(CidrGeoLookupTest, LoadsCsvFile) {
  auto path = std::filesystem::temp_directory_path() / "log_sentinel_geo.csv";
  {
    std::ofstream out(path);
    out << "# cidr,country\n"
        << "198.51.100.0/24, DE\n"
        << "\n"
        << "192.0.2.0/24,FR\n"
        << "broken line\n";
  }
  auto lookup = CidrGeoLookup::from_csv_file(path.string());
  EXPECT_EQ(lookup->size(), 2u);
  EXPECT_EQ(lookup->country_for("198.51.100.77"), "DE");
  EXPECT_EQ(lookup->country_for("192.0.2.1"), "FR");
  std::filesystem::remove(path);

  EXPECT_THROW(CidrGeoLookup::from_csv_file("/nonexistent/geo.csv"),
               EnrichmentLookupError);
}

TEST(HttpGeoLookupTest, RejectsMalformedEndpoint) {
  EXPECT_THROW(HttpGeoLookup("geo.internal/country", 100, 10),
               EnrichmentLookupError);
}

TEST(HttpGeoLookupTest, QueriesAndCachesCountries) {
  httplib::Server server;
  std::atomic<int> requests{0};
  server.Get(R"(/country/([0-9.]+))",
             [&](const httplib::Request &req, httplib::Response &res) {
               requests++;
               std::string ip = req.matches[1];
               if (ip == "192.0.2.9") {
                 res.status = 404;
                 return;
               }
               if (ip == "192.0.2.66") {
                 res.set_content("not json", "text/plain");
                 return;
               }
               res.set_content(R"({"country_code":"NL"})", "application/json");
             });
  int port = server.bind_to_any_port("127.0.0.1");
  ASSERT_GT(port, 0);
  std::thread listener([&] { server.listen_after_bind(); });
  while (!server.is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

  HttpGeoLookup lookup("http://127.0.0.1:" + std::to_string(port) +
                           "/country/{ip}",
                       1000, 16);
  EXPECT_EQ(lookup.country_for("192.0.2.1"), "NL");
  EXPECT_EQ(lookup.country_for("192.0.2.1"), "NL");
  EXPECT_EQ(requests.load(), 1);

  EXPECT_FALSE(lookup.country_for("192.0.2.9").has_value());
  EXPECT_THROW(lookup.country_for("192.0.2.66"), EnrichmentLookupError);
  EXPECT_EQ(lookup.cached_entries(), 2u);

  server.stop();
  listener.join();
}

TEST(HttpGeoLookupTest, UnreachableServiceIsLeftAloneDuringCooldown) {
  // Nothing listens on port 1, so every request fails
  HttpGeoLookup lookup("http://127.0.0.1:1/country/{ip}", 200, 16, 2, 60000);
  EXPECT_THROW(lookup.country_for("192.0.2.1"), EnrichmentLookupError);
  EXPECT_EQ(lookup.breaker().get_state(), CircuitBreaker::State::CLOSED);
  EXPECT_THROW(lookup.country_for("192.0.2.2"), EnrichmentLookupError);
  EXPECT_EQ(lookup.breaker().get_state(), CircuitBreaker::State::OPEN);

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 50; ++i)
    EXPECT_FALSE(lookup.country_for("192.0.2.3").has_value());
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(lookup.breaker().get_rejected_calls(), 50u);
  EXPECT_LT(elapsed, std::chrono::milliseconds(200));
  // Failures are not cached as answers
  EXPECT_EQ(lookup.cached_entries(), 0u);
}

TEST(UaClassifierTest, BotTokensWin) {
  HeuristicUaClassifier classifier(Config::EnrichmentConfig{}.bot_ua_substrings);
  EXPECT_EQ(classifier.classify("Googlebot/2.1 (+http://www.google.com/bot.html)")
                .ua_class,
            UaClass::Bot);
  EXPECT_EQ(classifier.classify("curl/8.4.0").ua_class, UaClass::Bot);
  EXPECT_EQ(classifier.classify("sqlmap/1.7#stable").ua_class, UaClass::Bot);
  // A crawler dressed as a browser is still a crawler
  EXPECT_EQ(classifier
                .classify("Mozilla/5.0 (compatible; SomeCrawler/1.0) "
                          "Chrome/120.0 Safari/537.36")
                .ua_class,
            UaClass::Bot);
}

TEST(UaClassifierTest, RecognizesBrowsers) {
  HeuristicUaClassifier classifier(Config::EnrichmentConfig{}.bot_ua_substrings);

  auto chrome = classifier.classify(
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/124.0.6367.91 Safari/537.36");
  EXPECT_EQ(chrome.ua_class, UaClass::Browser);
  EXPECT_EQ(chrome.browser_family, "Chrome");
  EXPECT_EQ(chrome.browser_major_version, 124);

  auto edge = classifier.classify(
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/124.0.0.0 Safari/537.36 Edg/124.0.2478.51");
  EXPECT_EQ(edge.browser_family, "Edge");

  auto safari = classifier.classify(
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 14_4) AppleWebKit/605.1.15 "
      "(KHTML, like Gecko) Version/17.4 Safari/605.1.15");
  EXPECT_EQ(safari.browser_family, "Safari");
  EXPECT_EQ(safari.browser_major_version, 17);

  auto firefox = classifier.classify(
      "Mozilla/5.0 (X11; Linux x86_64; rv:115.0) Gecko/20100101 Firefox/115.0");
  EXPECT_EQ(firefox.browser_family, "Firefox");
  EXPECT_EQ(firefox.browser_major_version, 115);

  auto generic = classifier.classify("Mozilla/5.0 (compatible; MSIE 10.0)");
  EXPECT_EQ(generic.ua_class, UaClass::Browser);
  EXPECT_TRUE(generic.browser_family.empty());
}

TEST(UaClassifierTest, UnknownAgents) {
  HeuristicUaClassifier classifier({"bot"});
  EXPECT_EQ(classifier.classify("").ua_class, UaClass::Unknown);
  EXPECT_EQ(classifier.classify("-").ua_class, UaClass::Unknown);
  EXPECT_EQ(classifier.classify("MyInternalTool/3").ua_class,
            UaClass::Unknown);
}

TEST(UaClassifierTest, MajorVersion) {
  EXPECT_EQ(UAParser::get_major_version("Chrome/124.0", "Chrome/"), 124);
  EXPECT_FALSE(UAParser::get_major_version("Chrome/", "Chrome/").has_value());
  EXPECT_FALSE(UAParser::get_major_version("Firefox/1", "Chrome/").has_value());
}

TEST(EnricherTest, LocalAddressesSkipGeo) {
  auto geo = std::make_shared<CidrGeoLookup>(
      std::vector<std::pair<std::string, std::string>>{{"10.0.0.0/8", "XX"}});
  Enricher enricher(geo, nullptr);
  LogRecord record = enricher.enrich(record_from("10.1.2.3"));
  ASSERT_TRUE(record.enrichment.has_value());
  EXPECT_EQ(record.enrichment->country, "Local");
  EXPECT_TRUE(record.enrichment->is_local_address);

  LogRecord v6 = enricher.enrich(record_from("::1"));
  EXPECT_EQ(v6.enrichment->country, "Local");
}

TEST(EnricherTest, UncoveredAddressIsUnknown) {
  auto geo = std::make_shared<CidrGeoLookup>(
      std::vector<std::pair<std::string, std::string>>{
          {"198.51.100.0/24", "DE"}});
  auto ua = std::make_shared<HeuristicUaClassifier>(
      std::vector<std::string>{"bot"});
  Enricher enricher(geo, ua);

  LogRecord known = enricher.enrich(record_from("198.51.100.4", "crawlbot"));
  EXPECT_EQ(known.enrichment->country, "DE");
  EXPECT_EQ(known.enrichment->ua_class, UaClass::Bot);
  EXPECT_FALSE(known.enrichment->is_local_address);

  LogRecord unknown = enricher.enrich(record_from("203.0.113.1"));
  EXPECT_EQ(unknown.enrichment->country, "Unknown");
  EXPECT_EQ(enricher.lookup_failures(), 0u);
}

TEST(EnricherTest, LookupFailureDegradesToUnknown) {
  Enricher enricher(std::make_shared<ThrowingGeoLookup>(), nullptr);
  LogRecord record = enricher.enrich(record_from("203.0.113.1", "curl/8"));
  ASSERT_TRUE(record.enrichment.has_value());
  EXPECT_EQ(record.enrichment->country, "Unknown");
  EXPECT_EQ(record.enrichment->ua_class, UaClass::Unknown);
  EXPECT_EQ(enricher.lookup_failures(), 1u);
  EXPECT_EQ(record.client_ip, "203.0.113.1");
}

TEST(EnricherTest, FromConfigSurvivesMissingGeoTable) {
  Config::EnrichmentConfig config;
  config.geo_cidr_file = "/nonexistent/geo.csv";
  auto enricher = Enricher::from_config(config);
  ASSERT_NE(enricher, nullptr);
  LogRecord record = enricher->enrich(record_from("203.0.113.1", "curl/8"));
  EXPECT_EQ(record.enrichment->country, "Unknown");
  EXPECT_EQ(record.enrichment->ua_class, UaClass::Bot);
}
