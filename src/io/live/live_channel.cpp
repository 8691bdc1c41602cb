#include "live_channel.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>

const char *live_event_type_to_string(LiveEventType type) {
  switch (type) {
  case LiveEventType::RecordCommitted:
    return "record_committed";
  case LiveEventType::AlertRaised:
    return "alert_raised";
  }
  return "unknown";
}

const char *disconnect_reason_to_string(DisconnectReason reason) {
  switch (reason) {
  case DisconnectReason::None:
    return "None";
  case DisconnectReason::SlowConsumer:
    return "SlowConsumer";
  case DisconnectReason::Unsubscribed:
    return "Unsubscribed";
  case DisconnectReason::ChannelClosed:
    return "ChannelClosed";
  }
  return "Unknown";
}

Subscription::Subscription(uint64_t id, size_t queue_capacity)
    : id_(id), queue_(queue_capacity) {}

std::optional<LiveEvent> Subscription::next(std::chrono::milliseconds timeout) {
  return queue_.wait_and_pop_for(timeout);
}

void Subscription::close(DisconnectReason reason) {
  DisconnectReason expected = DisconnectReason::None;
  reason_.compare_exchange_strong(expected, reason);
  queue_.close();
}

LiveChannel::LiveChannel(size_t subscriber_queue_capacity)
    : subscriber_queue_capacity_(subscriber_queue_capacity),
      disconnects_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_live_subscribers_disconnected_total",
          "Live subscribers disconnected because their queue overflowed")),
      subscribers_gauge_(MetricsRegistry::instance().create_gauge(
          "log_sentinel_live_subscribers", "Connected live subscribers")) {}

LiveChannel::~LiveChannel() { close(); }

std::shared_ptr<Subscription> LiveChannel::subscribe() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto subscription = std::make_shared<Subscription>(
      next_subscription_id_++, subscriber_queue_capacity_);
  if (closed_) {
    subscription->close(DisconnectReason::ChannelClosed);
    return subscription;
  }
  subscribers_.push_back(subscription);
  subscribers_gauge_.Increment();
  LOG(LogLevel::DEBUG, LogComponent::IO_LIVE,
      "Subscriber " << subscription->id() << " connected ("
                    << subscribers_.size() << " total)");
  return subscription;
}

void LiveChannel::unsubscribe(
    const std::shared_ptr<Subscription> &subscription) {
  if (!subscription)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(subscribers_.begin(), subscribers_.end(), subscription);
  if (it == subscribers_.end())
    return;
  (*it)->close(DisconnectReason::Unsubscribed);
  subscribers_.erase(it);
  subscribers_gauge_.Decrement();
}

void LiveChannel::publish_record(const LogRecord &record) {
  LiveEvent event;
  event.type = LiveEventType::RecordCommitted;
  event.payload = record;
  publish(std::move(event));
}

void LiveChannel::publish_alert(const Alert &alert) {
  LiveEvent event;
  event.type = LiveEventType::AlertRaised;
  event.payload = alert;
  publish(std::move(event));
}

void LiveChannel::publish(LiveEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || subscribers_.empty())
    return;
  event.sequence = next_sequence_++;

  auto it = subscribers_.begin();
  while (it != subscribers_.end()) {
    if ((*it)->offer(event)) {
      ++it;
      continue;
    }
    (*it)->close(DisconnectReason::SlowConsumer);
    slow_consumer_disconnects_++;
    disconnects_counter_.Increment();
    subscribers_gauge_.Decrement();
    LOG(LogLevel::WARN, LogComponent::IO_LIVE,
        "Subscriber " << (*it)->id()
                      << " disconnected: queue full (SlowConsumer)");
    it = subscribers_.erase(it);
  }
}

void LiveChannel::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
    return;
  closed_ = true;
  for (auto &subscription : subscribers_) {
    subscription->close(DisconnectReason::ChannelClosed);
    subscribers_gauge_.Decrement();
  }
  subscribers_.clear();
}

size_t LiveChannel::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void LiveChannel::set_subscriber_queue_capacity(size_t capacity) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriber_queue_capacity_ = capacity ? capacity : 1;
}
