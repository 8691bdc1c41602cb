#include "alert_emitter.hpp"
#include "errors.hpp"
#include "io/live/live_channel.hpp"
#include "io/store/record_store.hpp"
#include "logger.hpp"
#include "metrics_registry.hpp"
#include "utils/utils.hpp"

#include <algorithm>

AlertEmitter::AlertEmitter(const Config::AlertingConfig &config,
                           std::shared_ptr<IRecordStore> store,
                           std::shared_ptr<LiveChannel> live_channel)
    : config_(config), interval_ms_(config.coalescing_interval_seconds * 1000),
      store_(std::move(store)), live_channel_(std::move(live_channel)),
      stripe_count_(std::clamp<size_t>(config.coalescing_stripes, 1,
                                        MAX_STRIPES)),
      coalesced_counter_(MetricsRegistry::instance().create_counter(
          "log_sentinel_alerts_coalesced_total",
          "Triggers merged into an existing alert")) {
  auto &raised = MetricsRegistry::instance().create_counter_family(
      "log_sentinel_alerts_raised_total", "Alerts created, by attack type");
  for (AttackType type :
       {AttackType::SQLInjection, AttackType::XSS, AttackType::PathTraversal,
        AttackType::BruteForce, AttackType::DoS,
        AttackType::DataExfiltration})
    raised_counters_[static_cast<size_t>(type)] =
        &raised.Add({{"type", attack_type_to_string(type)}});
}

std::vector<Alert>
AlertEmitter::emit(const std::vector<SignatureHit> &signature_hits,
                   const std::vector<BehaviorHit> &behavior_hits,
                   const LogRecord &record) {
  std::vector<Alert> alerts;
  alerts.reserve(signature_hits.size() + behavior_hits.size());

  for (const auto &hit : signature_hits)
    alerts.push_back(handle_trigger(Trigger{hit.attack_type, record.client_ip,
                                            record.endpoint(), hit.confidence,
                                            hit.evidence},
                                    record));

  for (const auto &hit : behavior_hits)
    alerts.push_back(handle_trigger(Trigger{hit.attack_type, hit.client_ip,
                                            hit.endpoint, hit.confidence,
                                            hit.evidence},
                                    record));
  return alerts;
}

Alert AlertEmitter::handle_trigger(const Trigger &trigger,
                                   const LogRecord &record) {
  uint64_t interval_ms;
  size_t max_sources;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    interval_ms = interval_ms_;
    max_sources = config_.max_source_records_per_alert;
  }

  const uint64_t ts = record.timestamp_ms;
  const double confidence = std::clamp(trigger.confidence, 0.0, 1.0);

  std::string group_key = attack_type_to_string(trigger.attack_type);
  group_key.push_back('|');
  group_key += trigger.client_ip;
  group_key.push_back('|');
  group_key += trigger.endpoint;

  Stripe &stripe = stripe_for(group_key);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.groups.find(group_key);
  if (it != stripe.groups.end()) {
    Group &group = it->second;
    uint64_t distance = ts >= group.first_trigger_ms
                            ? ts - group.first_trigger_ms
                            : group.first_trigger_ms - ts;
    if (distance < interval_ms) {
      Group merged = group;
      merged.alert.trigger_count++;
      merged.alert.timestamp_ms = std::min(merged.alert.timestamp_ms, ts);
      merged.alert.last_trigger_ms = std::max(merged.alert.last_trigger_ms, ts);
      if (confidence > merged.max_confidence) {
        merged.max_confidence = confidence;
        merged.alert.evidence = trigger.evidence;
      }
      merged.alert.confidence = corroborated(merged);

      const std::string record_id = record.record_id();
      auto &ids = merged.alert.source_record_ids;
      if (ids.size() < max_sources &&
          std::find(ids.begin(), ids.end(), record_id) == ids.end())
        ids.push_back(record_id);

      store_->upsert_alert(merged.alert);
      group = std::move(merged);
      alerts_coalesced_++;
      coalesced_counter_.Increment();
      LOG(LogLevel::TRACE, LogComponent::ALERTING,
          "Coalesced " << group_key << " into alert " << group.alert.id
                       << " (triggers=" << group.alert.trigger_count << ")");
      return group.alert;
    }
  }

  Group group;
  group.first_trigger_ms = ts;
  group.max_confidence = confidence;
  group.alert.id = make_alert_id(trigger.attack_type, trigger.client_ip,
                                 trigger.endpoint, ts);
  group.alert.timestamp_ms = ts;
  group.alert.last_trigger_ms = ts;
  group.alert.attack_type = trigger.attack_type;
  group.alert.client_ip = trigger.client_ip;
  group.alert.endpoint = trigger.endpoint;
  group.alert.confidence = confidence;
  group.alert.evidence = trigger.evidence;
  group.alert.trigger_count = 1;
  if (max_sources > 0)
    group.alert.source_record_ids.push_back(record.record_id());

  store_->upsert_alert(group.alert);

  // An out-of-order trigger older than the open group gets its own alert
  // but does not displace the group
  if (it == stripe.groups.end())
    it = stripe.groups.emplace(group_key, group).first;
  else if (ts > it->second.first_trigger_ms)
    it->second = group;

  alerts_created_++;
  raised_counters_[static_cast<size_t>(trigger.attack_type)]->Increment();
  LOG(LogLevel::INFO, LogComponent::ALERTING,
      attack_type_to_string(trigger.attack_type)
          << " alert " << group.alert.id << " ip=" << trigger.client_ip
          << " endpoint=" << trigger.endpoint
          << " confidence=" << group.alert.confidence << " evidence=\""
          << trigger.evidence << "\"");

  if (live_channel_)
    live_channel_->publish_alert(group.alert);
  return group.alert;
}

double AlertEmitter::corroborated(const Group &group) const {
  size_t min_triggers;
  double bonus;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    min_triggers = config_.corroboration_min_triggers;
    bonus = config_.corroboration_bonus;
  }
  if (!is_signature_attack_type(group.alert.attack_type) ||
      min_triggers == 0 || group.alert.trigger_count < min_triggers)
    return group.max_confidence;
  return std::min(1.0, group.max_confidence + bonus);
}

size_t AlertEmitter::purge_stale(uint64_t now_ms) {
  uint64_t interval_ms;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    interval_ms = interval_ms_;
  }

  size_t purged = 0;
  for (size_t i = 0; i < stripe_count_; ++i) {
    Stripe &stripe = stripes_[i];
    std::lock_guard<std::mutex> lock(stripe.mutex);
    for (auto it = stripe.groups.begin(); it != stripe.groups.end();) {
      if (it->second.first_trigger_ms + interval_ms <= now_ms) {
        it = stripe.groups.erase(it);
        ++purged;
      } else {
        ++it;
      }
    }
  }
  if (purged > 0)
    LOG(LogLevel::DEBUG, LogComponent::ALERTING,
        "Purged " << purged << " closed coalescing groups");
  return purged;
}

void AlertEmitter::reconfigure(const Config::AlertingConfig &config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  // The stripe layout is fixed for the emitter's lifetime
  config_ = config;
  interval_ms_ = config.coalescing_interval_seconds * 1000;
}

size_t AlertEmitter::open_groups() const {
  size_t total = 0;
  for (size_t i = 0; i < stripe_count_; ++i) {
    std::lock_guard<std::mutex> lock(stripes_[i].mutex);
    total += stripes_[i].groups.size();
  }
  return total;
}

AlertEmitter::Stripe &AlertEmitter::stripe_for(const std::string &group_key) {
  return stripes_[Utils::fnv1a_64(group_key) % stripe_count_];
}
