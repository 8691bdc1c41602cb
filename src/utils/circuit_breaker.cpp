#include "circuit_breaker.hpp"

#include <stdexcept>

CircuitBreaker::CircuitBreaker(const std::string &name, const Config &config)
    : name_(name), config_(config) {
  if (config_.failure_threshold == 0)
    throw std::invalid_argument("Circuit breaker '" + name +
                                "' needs a failure threshold of at least 1");
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::OPEN && Clock::now() - opened_at_ >= config_.cooldown)
    transition_to_state(State::HALF_OPEN);

  if (state_ == State::CLOSED)
    return true;
  if (state_ == State::HALF_OPEN && !trial_in_flight_) {
    trial_in_flight_ = true;
    return true;
  }
  rejected_calls_++;
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_failures_ = 0;
  transition_to_state(State::CLOSED);
}

bool CircuitBreaker::record_failure() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_failures_++;

  // Any failure of the trial call re-opens the breaker
  if (state_ == State::HALF_OPEN ||
      (state_ == State::CLOSED &&
       consecutive_failures_ >= config_.failure_threshold)) {
    transition_to_state(State::OPEN);
    return true;
  }
  return false;
}

CircuitBreaker::State CircuitBreaker::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string CircuitBreaker::get_state_string() const {
  switch (get_state()) {
  case State::CLOSED:
    return "CLOSED";
  case State::OPEN:
    return "OPEN";
  case State::HALF_OPEN:
    return "HALF_OPEN";
  }
  return "UNKNOWN";
}

size_t CircuitBreaker::get_rejected_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rejected_calls_;
}

// Caller holds mutex_
void CircuitBreaker::transition_to_state(State new_state) {
  if (new_state == state_)
    return;
  state_ = new_state;
  trial_in_flight_ = false;
  if (new_state == State::OPEN)
    opened_at_ = Clock::now();
}
