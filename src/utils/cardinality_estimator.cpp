#include "cardinality_estimator.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>

CardinalityEstimator::CardinalityEstimator(size_t exact_cap)
    : exact_cap_(exact_cap) {}

uint64_t CardinalityEstimator::hash_value(std::string_view value) {
  // FNV-1a followed by the splitmix64 finalizer to spread the high bits
  uint64_t h = Utils::fnv1a_64(value);
  h ^= h >> 30;
  h *= 0xbf58476d1ce4e5b9ULL;
  h ^= h >> 27;
  h *= 0x94d049bb133111ebULL;
  h ^= h >> 31;
  return h;
}

void CardinalityEstimator::add_hash(uint64_t hash) {
  size_t index = static_cast<size_t>(hash >> (64 - PRECISION));
  uint64_t rest = hash << PRECISION;
  uint8_t rank = 1;
  while (rank <= 64 - PRECISION && (rest & (1ULL << 63)) == 0) {
    ++rank;
    rest <<= 1;
  }
  registers_[index] = std::max(registers_[index], rank);
}

void CardinalityEstimator::promote() {
  registers_.assign(REGISTER_COUNT, 0);
  for (const auto &value : exact_values_)
    add_hash(hash_value(value));
  exact_values_.clear();
}

void CardinalityEstimator::add(std::string_view value) {
  if (is_exact()) {
    exact_values_.emplace(value);
    if (exact_values_.size() > exact_cap_)
      promote();
    return;
  }
  add_hash(hash_value(value));
}

void CardinalityEstimator::merge(const CardinalityEstimator &other) {
  if (is_exact() && other.is_exact()) {
    for (const auto &value : other.exact_values_)
      exact_values_.insert(value);
    if (exact_values_.size() > exact_cap_)
      promote();
    return;
  }

  if (is_exact())
    promote();
  if (other.is_exact()) {
    for (const auto &value : other.exact_values_)
      add_hash(hash_value(value));
    return;
  }
  for (size_t i = 0; i < REGISTER_COUNT; ++i)
    registers_[i] = std::max(registers_[i], other.registers_[i]);
}

uint64_t CardinalityEstimator::estimate() const {
  if (is_exact())
    return exact_values_.size();

  const double m = static_cast<double>(REGISTER_COUNT);
  const double alpha = 0.7213 / (1.0 + 1.079 / m);

  double sum = 0.0;
  size_t zero_registers = 0;
  for (uint8_t r : registers_) {
    sum += std::ldexp(1.0, -static_cast<int>(r));
    if (r == 0)
      ++zero_registers;
  }

  double raw = alpha * m * m / sum;
  // Small range correction (linear counting)
  if (raw <= 2.5 * m && zero_registers > 0)
    raw = m * std::log(m / static_cast<double>(zero_registers));
  return static_cast<uint64_t>(std::llround(raw));
}
