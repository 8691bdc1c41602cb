#include "utils/cardinality_estimator.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(CardinalityEstimatorTest, ExactBelowCap) {
  CardinalityEstimator estimator(100);
  for (int i = 0; i < 50; ++i) {
    estimator.add("198.51.100." + std::to_string(i));
    estimator.add("198.51.100." + std::to_string(i)); // duplicates ignored
  }
  EXPECT_TRUE(estimator.is_exact());
  EXPECT_EQ(estimator.estimate(), 50u);
}

TEST(CardinalityEstimatorTest, SketchWithinTolerance) {
  CardinalityEstimator estimator(64);
  const int distinct = 20000;
  for (int i = 0; i < distinct; ++i)
    estimator.add("client-" + std::to_string(i));

  EXPECT_FALSE(estimator.is_exact());
  double estimate = static_cast<double>(estimator.estimate());
  EXPECT_NEAR(estimate, distinct, distinct * 0.05);
}

TEST(CardinalityEstimatorTest, MergeCountsUnion) {
  CardinalityEstimator left(1000);
  CardinalityEstimator right(1000);
  for (int i = 0; i < 30; ++i)
    left.add("ip-" + std::to_string(i));
  for (int i = 20; i < 40; ++i)
    right.add("ip-" + std::to_string(i));

  left.merge(right);
  EXPECT_EQ(left.estimate(), 40u);
}

TEST(CardinalityEstimatorTest, MergeExactIntoSketch) {
  CardinalityEstimator sketch(16);
  for (int i = 0; i < 5000; ++i)
    sketch.add("a-" + std::to_string(i));
  CardinalityEstimator exact(16);
  for (int i = 0; i < 10; ++i)
    exact.add("b-" + std::to_string(i));

  sketch.merge(exact);
  EXPECT_NEAR(static_cast<double>(sketch.estimate()), 5010.0, 5010.0 * 0.05);
}
