#ifndef LIVE_CHANNEL_HPP
#define LIVE_CHANNEL_HPP

#include "core/alert.hpp"
#include "core/log_record.hpp"
#include "utils/bounded_queue.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

enum class LiveEventType { RecordCommitted, AlertRaised };

const char *live_event_type_to_string(LiveEventType type);

struct LiveEvent {
  LiveEventType type = LiveEventType::RecordCommitted;
  uint64_t sequence = 0;
  std::variant<LogRecord, Alert> payload;
};

enum class DisconnectReason { None, SlowConsumer, Unsubscribed, ChannelClosed };

const char *disconnect_reason_to_string(DisconnectReason reason);

class LiveChannel;

// One subscriber's view of the channel. Events arrive in publish order until
// the subscription is closed; after that the remaining queued events can
// still be drained.
class Subscription {
public:
  Subscription(uint64_t id, size_t queue_capacity);

  // Waits up to `timeout`; nullopt on timeout or once closed and drained
  std::optional<LiveEvent> next(std::chrono::milliseconds timeout);

  bool is_closed() const { return queue_.is_closed(); }
  DisconnectReason disconnect_reason() const { return reason_.load(); }
  uint64_t id() const { return id_; }
  size_t pending() const { return queue_.size(); }

private:
  friend class LiveChannel;

  // False when the queue is full or already closed
  bool offer(const LiveEvent &event) { return queue_.try_push(event); }
  void close(DisconnectReason reason);

  uint64_t id_;
  BoundedQueue<LiveEvent> queue_;
  std::atomic<DisconnectReason> reason_{DisconnectReason::None};
};

// Fan-out of committed records and raised alerts. Publishing never blocks: a
// subscriber whose queue is full is disconnected with SlowConsumer.
class LiveChannel {
public:
  explicit LiveChannel(size_t subscriber_queue_capacity = 1024);
  ~LiveChannel();

  LiveChannel(const LiveChannel &) = delete;
  LiveChannel &operator=(const LiveChannel &) = delete;

  std::shared_ptr<Subscription> subscribe();
  void unsubscribe(const std::shared_ptr<Subscription> &subscription);

  void publish_record(const LogRecord &record);
  void publish_alert(const Alert &alert);

  // Disconnects everyone with ChannelClosed and refuses new subscribers
  void close();

  size_t subscriber_count() const;
  uint64_t slow_consumer_disconnects() const {
    return slow_consumer_disconnects_.load();
  }
  void set_subscriber_queue_capacity(size_t capacity);

private:
  void publish(LiveEvent event);

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  size_t subscriber_queue_capacity_;
  uint64_t next_subscription_id_ = 1;
  uint64_t next_sequence_ = 1;
  bool closed_ = false;

  std::atomic<uint64_t> slow_consumer_disconnects_{0};
  prometheus::Counter &disconnects_counter_;
  prometheus::Gauge &subscribers_gauge_;
};

#endif // LIVE_CHANNEL_HPP
