#include "core/query_service.hpp"
#include "core/errors.hpp"
#include "io/store/memory_record_store.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace {

constexpr uint64_t BASE_MS = 1672617600000; // 2023-01-02T00:00:00Z
constexpr uint64_t HOUR_MS = 3600ULL * 1000;

LogRecord make_record(uint64_t line, uint64_t ts, int status) {
  LogRecord record;
  record.timestamp_ms = ts;
  record.client_ip = "192.0.2." + std::to_string(line % 3);
  record.method = "GET";
  record.path = "/p" + std::to_string(line % 2);
  record.status_code = status;
  record.bytes_sent = 10;
  record.source_file_id = "query.log";
  record.line_offset = line;
  return record;
}

} // namespace

class QueryServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    store = std::make_shared<MemoryRecordStore>();
    aggregator = std::make_shared<MetricsAggregator>(Config::MetricsConfig{});
    for (uint64_t line = 1; line <= 12; ++line) {
      LogRecord record =
          make_record(line, BASE_MS + line * HOUR_MS / 2, line % 4 ? 200 : 404);
      store->append_record(record);
      aggregator->update(record);
    }
    Alert alert;
    alert.id = "alert-1";
    alert.timestamp_ms = BASE_MS + HOUR_MS;
    alert.attack_type = AttackType::PathTraversal;
    alert.client_ip = "192.0.2.1";
    alert.endpoint = "/p1";
    alert.confidence = 0.8;
    store->upsert_alert(alert);

    service = std::make_unique<QueryService>(store, aggregator, nullptr, 5);
  }

  std::shared_ptr<MemoryRecordStore> store;
  std::shared_ptr<MetricsAggregator> aggregator;
  std::unique_ptr<QueryService> service;
};

TEST_F(QueryServiceTest, RejectsInvertedRange) {
  TimeRange inverted{BASE_MS + HOUR_MS, BASE_MS};
  EXPECT_THROW(service->metrics(inverted, Granularity::Hour), QueryError);
  EXPECT_THROW(service->summary(inverted), QueryError);
  EXPECT_THROW(service->alerts(inverted, 10, AlertFilter{}), QueryError);
  EXPECT_THROW(service->records(inverted, RecordFilter{}, PageRequest{1, 5}),
               QueryError);
}

TEST_F(QueryServiceTest, ValidatesPaging) {
  TimeRange day{BASE_MS, BASE_MS + 24 * HOUR_MS};
  EXPECT_THROW(service->records(day, RecordFilter{}, PageRequest{0, 5}),
               QueryError);
  EXPECT_THROW(service->records(day, RecordFilter{}, PageRequest{1, 0}),
               QueryError);
  EXPECT_THROW(service->records(day, RecordFilter{}, PageRequest{1, 6}),
               QueryError);

  RecordFilter bad_status;
  bad_status.status_code = 42;
  EXPECT_THROW(service->records(day, bad_status, PageRequest{1, 5}),
               QueryError);

  auto page = service->records(day, RecordFilter{}, PageRequest{3, 5});
  EXPECT_EQ(page.total_count, 12u);
  EXPECT_EQ(page.page_count, 3u);
  ASSERT_EQ(page.items.size(), 2u);
  EXPECT_EQ(page.items[0].line_offset, 11u);

  service->set_max_page_size(20);
  EXPECT_EQ(service->records(day, RecordFilter{}, PageRequest{1, 20})
                .items.size(),
            12u);
}

TEST_F(QueryServiceTest, ValidatesAlertArguments) {
  TimeRange day{BASE_MS, BASE_MS + 24 * HOUR_MS};
  EXPECT_THROW(service->alerts(day, 0, AlertFilter{}), QueryError);
  EXPECT_THROW(service->alerts(day, QueryService::MAX_ALERT_LIMIT + 1,
                               AlertFilter{}),
               QueryError);
  AlertFilter bad;
  bad.min_confidence = 1.5;
  EXPECT_THROW(service->alerts(day, 10, bad), QueryError);

  auto alerts = service->alerts(day, 10, AlertFilter{});
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].id, "alert-1");
}

TEST_F(QueryServiceTest, ValidatesTopLimit) {
  TimeRange day{BASE_MS, BASE_MS + 24 * HOUR_MS};
  EXPECT_THROW(service->top(TopDimension::ClientIp, 0, day), QueryError);
  EXPECT_THROW(
      service->top(TopDimension::ClientIp, QueryService::MAX_TOP_LIMIT + 1, day),
      QueryError);
  auto top = service->top(TopDimension::StatusCode, 5, day);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].key, "200");
  EXPECT_EQ(top[0].count, 9u);
}

TEST_F(QueryServiceTest, MetricsAndSummaryAgree) {
  TimeRange range{BASE_MS, BASE_MS + 7 * HOUR_MS};
  auto series = service->metrics(range, Granularity::Hour);
  ASSERT_EQ(series.size(), 7u);
  uint64_t total = 0;
  for (const auto &bucket : series)
    total += bucket.request_count;
  EXPECT_EQ(total, 12u);
  EXPECT_EQ(service->summary(range).request_count, 12u);
  EXPECT_EQ(service->timeline(range, Granularity::Day).size(), 1u);
}

TEST_F(QueryServiceTest, NoPipelineMeansNoSummaries) {
  EXPECT_TRUE(service->batch_summaries().empty());
  EXPECT_TRUE(service->integrity_stamps().empty());
}
