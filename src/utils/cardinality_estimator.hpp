#ifndef CARDINALITY_ESTIMATOR_HPP
#define CARDINALITY_ESTIMATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

// Distinct-count estimator that stays exact up to `exact_cap` values and then
// switches to a HyperLogLog sketch with 2^12 registers (about 1.6% standard
// error). Two estimators merge into the estimator of the union.
class CardinalityEstimator {
public:
  static constexpr unsigned PRECISION = 12;
  static constexpr size_t REGISTER_COUNT = size_t{1} << PRECISION;

  explicit CardinalityEstimator(size_t exact_cap = 1024);

  void add(std::string_view value);
  void merge(const CardinalityEstimator &other);

  uint64_t estimate() const;
  bool is_exact() const { return registers_.empty(); }

private:
  static uint64_t hash_value(std::string_view value);
  void promote();
  void add_hash(uint64_t hash);

  size_t exact_cap_;
  std::unordered_set<std::string> exact_values_;
  std::vector<uint8_t> registers_;
};

#endif // CARDINALITY_ESTIMATOR_HPP
