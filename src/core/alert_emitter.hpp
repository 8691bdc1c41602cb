#ifndef ALERT_EMITTER_HPP
#define ALERT_EMITTER_HPP

#include "alert.hpp"
#include "config.hpp"
#include "log_record.hpp"

#include <prometheus/counter.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class IRecordStore;
class LiveChannel;

// Turns classifier hits into persisted alerts. Triggers with the same
// (attack_type, client_ip, endpoint) within the coalescing interval of a
// group's first trigger are merged into that group's alert; the live channel
// hears about an alert once, when it is created.
class AlertEmitter {
public:
  AlertEmitter(const Config::AlertingConfig &config,
               std::shared_ptr<IRecordStore> store,
               std::shared_ptr<LiveChannel> live_channel = nullptr);

  AlertEmitter(const AlertEmitter &) = delete;
  AlertEmitter &operator=(const AlertEmitter &) = delete;

  // Returns the created or updated alerts. Throws StorageError when the
  // store rejects an alert.
  std::vector<Alert> emit(const std::vector<SignatureHit> &signature_hits,
                          const std::vector<BehaviorHit> &behavior_hits,
                          const LogRecord &record);

  // Drops groups whose interval ended before `now_ms`. Returns how many.
  size_t purge_stale(uint64_t now_ms);

  void reconfigure(const Config::AlertingConfig &config);

  size_t open_groups() const;
  uint64_t alerts_created() const { return alerts_created_.load(); }
  uint64_t alerts_coalesced() const { return alerts_coalesced_.load(); }

private:
  struct Trigger {
    AttackType attack_type;
    std::string client_ip;
    std::string endpoint;
    double confidence;
    std::string evidence;
  };

  struct Group {
    Alert alert;
    uint64_t first_trigger_ms = 0;
    double max_confidence = 0.0;
  };

  struct Stripe {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Group> groups;
  };

  static constexpr size_t MAX_STRIPES = 64;

  Alert handle_trigger(const Trigger &trigger, const LogRecord &record);
  Stripe &stripe_for(const std::string &group_key);
  double corroborated(const Group &group) const;

  mutable std::mutex config_mutex_;
  Config::AlertingConfig config_;
  uint64_t interval_ms_;

  std::shared_ptr<IRecordStore> store_;
  std::shared_ptr<LiveChannel> live_channel_;

  std::array<Stripe, MAX_STRIPES> stripes_;
  size_t stripe_count_;

  std::atomic<uint64_t> alerts_created_{0};
  std::atomic<uint64_t> alerts_coalesced_{0};

  std::array<prometheus::Counter *, 6> raised_counters_{};
  prometheus::Counter &coalesced_counter_;
};

#endif // ALERT_EMITTER_HPP
