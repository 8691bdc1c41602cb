#include "ewma_baseline.hpp"

#include <cmath>
#include <stdexcept>

EwmaBaseline::EwmaBaseline(double alpha) : alpha_(alpha) {
  if (alpha <= 0.0 || alpha > 1.0)
    throw std::invalid_argument("Alpha must be between 0 and 1");
}

void EwmaBaseline::add_value(double value, uint64_t timestamp_ms) {
  if (sample_count_ == 0) {
    // Initialize with first value
    ewma_mean_ = value;
    ewma_variance_ = 0.0;
  } else {
    double delta = value - ewma_mean_;
    ewma_mean_ += alpha_ * delta;
    ewma_variance_ = (1.0 - alpha_) * (ewma_variance_ + alpha_ * delta * delta);
  }

  last_update_time_ = timestamp_ms;
  sample_count_++;
}

double EwmaBaseline::get_standard_deviation() const {
  return std::sqrt(ewma_variance_);
}

double EwmaBaseline::upper_bound(double multiplier) const {
  return ewma_mean_ + multiplier * get_standard_deviation();
}

void EwmaBaseline::set_alpha(double alpha) {
  if (alpha <= 0.0 || alpha > 1.0)
    throw std::invalid_argument("Alpha must be between 0 and 1");
  alpha_ = alpha;
}

void EwmaBaseline::reset() {
  ewma_mean_ = 0.0;
  ewma_variance_ = 0.0;
  sample_count_ = 0;
  last_update_time_ = 0;
}
