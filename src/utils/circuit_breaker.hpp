#ifndef CIRCUIT_BREAKER_HPP
#define CIRCUIT_BREAKER_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

/**
 * Stops calling a failing dependency for a cooldown period.
 *
 * CLOSED lets every call through. After `failure_threshold` consecutive
 * failures the breaker OPENs and rejects calls until `cooldown` has passed.
 * It then lets a single trial call through (HALF_OPEN): success closes it
 * again, failure re-opens it for another cooldown. Thread-safe.
 */
class CircuitBreaker {
public:
  enum class State { CLOSED, OPEN, HALF_OPEN };

  struct Config {
    size_t failure_threshold = 5;
    std::chrono::milliseconds cooldown{30000};
  };

  explicit CircuitBreaker(const std::string &name, const Config &config);

  // False while the breaker is open; claims the trial call when half-open
  bool allow_request();

  void record_success();
  // True when this failure opened the breaker
  bool record_failure();

  State get_state() const;
  std::string get_state_string() const;
  const std::string &name() const { return name_; }
  size_t get_rejected_calls() const;

private:
  using Clock = std::chrono::steady_clock;

  void transition_to_state(State new_state);

  const std::string name_;
  const Config config_;

  mutable std::mutex mutex_;
  State state_ = State::CLOSED;
  size_t consecutive_failures_ = 0;
  size_t rejected_calls_ = 0;
  bool trial_in_flight_ = false;
  Clock::time_point opened_at_;
};

#endif // CIRCUIT_BREAKER_HPP
