#include "io/live/live_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace {

LogRecord record_at(uint64_t line) {
  LogRecord record;
  record.timestamp_ms = 1672574400000 + line;
  record.client_ip = "192.0.2.1";
  record.path = "/";
  record.status_code = 200;
  record.source_file_id = "live.log";
  record.line_offset = line;
  return record;
}

} // namespace

TEST(LiveChannelTest, DeliversInPublishOrder) {
  LiveChannel channel(8);
  auto subscription = channel.subscribe();
  channel.publish_record(record_at(1));
  Alert alert;
  alert.id = "abc";
  channel.publish_alert(alert);
  channel.publish_record(record_at(2));

  auto first = subscription->next(std::chrono::milliseconds(10));
  auto second = subscription->next(std::chrono::milliseconds(10));
  auto third = subscription->next(std::chrono::milliseconds(10));
  ASSERT_TRUE(first && second && third);
  EXPECT_EQ(first->type, LiveEventType::RecordCommitted);
  EXPECT_EQ(second->type, LiveEventType::AlertRaised);
  EXPECT_EQ(std::get<Alert>(second->payload).id, "abc");
  EXPECT_LT(first->sequence, second->sequence);
  EXPECT_LT(second->sequence, third->sequence);
  EXPECT_EQ(std::get<LogRecord>(third->payload).line_offset, 2u);
}

TEST(LiveChannelTest, SlowConsumerIsDisconnected) {
  LiveChannel channel(2);
  auto slow = channel.subscribe();
  auto fast = channel.subscribe();
  uint64_t before = channel.slow_consumer_disconnects();

  for (uint64_t i = 1; i <= 5; ++i) {
    channel.publish_record(record_at(i));
    // The fast subscriber keeps up
    ASSERT_TRUE(fast->next(std::chrono::milliseconds(10)).has_value());
  }

  EXPECT_TRUE(slow->is_closed());
  EXPECT_EQ(slow->disconnect_reason(), DisconnectReason::SlowConsumer);
  EXPECT_FALSE(fast->is_closed());
  EXPECT_EQ(channel.subscriber_count(), 1u);
  EXPECT_EQ(channel.slow_consumer_disconnects(), before + 1);

  // What was queued before the overflow can still be drained
  EXPECT_TRUE(slow->next(std::chrono::milliseconds(1)).has_value());
  EXPECT_TRUE(slow->next(std::chrono::milliseconds(1)).has_value());
  EXPECT_FALSE(slow->next(std::chrono::milliseconds(1)).has_value());
}

TEST(LiveChannelTest, UnsubscribeAndClose) {
  LiveChannel channel(4);
  auto a = channel.subscribe();
  auto b = channel.subscribe();
  EXPECT_NE(a->id(), b->id());

  channel.unsubscribe(a);
  EXPECT_EQ(a->disconnect_reason(), DisconnectReason::Unsubscribed);
  EXPECT_EQ(channel.subscriber_count(), 1u);

  channel.close();
  EXPECT_EQ(b->disconnect_reason(), DisconnectReason::ChannelClosed);
  EXPECT_EQ(channel.subscriber_count(), 0u);

  auto late = channel.subscribe();
  EXPECT_TRUE(late->is_closed());
  EXPECT_EQ(late->disconnect_reason(), DisconnectReason::ChannelClosed);
}

TEST(LiveChannelTest, NextTimesOutWhenIdle) {
  LiveChannel channel(4);
  auto subscription = channel.subscribe();
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(subscription->next(std::chrono::milliseconds(20)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(15));
}

TEST(LiveChannelTest, WakesBlockedSubscriber) {
  LiveChannel channel(4);
  auto subscription = channel.subscribe();
  std::thread publisher([&channel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.publish_record(record_at(7));
  });
  auto event = subscription->next(std::chrono::seconds(2));
  publisher.join();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(std::get<LogRecord>(event->payload).line_offset, 7u);
}

TEST(LiveChannelTest, NamesAreStable) {
  EXPECT_STREQ(disconnect_reason_to_string(DisconnectReason::SlowConsumer),
               "SlowConsumer");
  EXPECT_STREQ(live_event_type_to_string(LiveEventType::AlertRaised),
               "alert_raised");
}
