#ifndef EWMA_BASELINE_HPP
#define EWMA_BASELINE_HPP

#include <cstddef>
#include <cstdint>

/**
 * Exponentially weighted mean and variance of a stream of observations.
 * Not synchronized: each instance is owned by a single shard.
 */
class EwmaBaseline {
public:
  /**
   * @param alpha Decay factor (0 < alpha <= 1, smaller = more stable)
   */
  explicit EwmaBaseline(double alpha = 0.05);

  /**
   * Fold one observation into the baseline
   */
  void add_value(double value, uint64_t timestamp_ms);

  double get_mean() const { return ewma_mean_; }
  double get_variance() const { return ewma_variance_; }
  double get_standard_deviation() const;

  size_t get_sample_count() const { return sample_count_; }
  uint64_t get_last_update_time() const { return last_update_time_; }

  /**
   * True once enough samples were folded in for the baseline to be trusted
   */
  bool is_established(size_t min_samples) const {
    return sample_count_ >= min_samples;
  }

  /**
   * Mean plus `multiplier` standard deviations
   */
  double upper_bound(double multiplier) const;

  void set_alpha(double alpha);
  void reset();

private:
  double alpha_;
  double ewma_mean_ = 0.0;
  double ewma_variance_ = 0.0;
  size_t sample_count_ = 0;
  uint64_t last_update_time_ = 0;
};

#endif // EWMA_BASELINE_HPP
