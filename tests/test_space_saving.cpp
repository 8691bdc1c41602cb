#include "utils/space_saving.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(SpaceSavingTest, ExactBelowCapacity) {
  SpaceSaving<std::string> summary(8);
  for (int i = 0; i < 5; ++i)
    summary.offer("10.0.0.1");
  for (int i = 0; i < 3; ++i)
    summary.offer("10.0.0.2");
  summary.offer("10.0.0.3");

  auto top = summary.top(2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].key, "10.0.0.1");
  EXPECT_EQ(top[0].count, 5u);
  EXPECT_EQ(top[0].error, 0u);
  EXPECT_EQ(top[1].key, "10.0.0.2");
  EXPECT_EQ(top[1].count, 3u);
  EXPECT_EQ(summary.total(), 9u);
}

TEST(SpaceSavingTest, EvictionInheritsMinimumAsError) {
  SpaceSaving<std::string> summary(2);
  summary.offer("a", 5);
  summary.offer("b", 2);
  summary.offer("c"); // evicts b

  EXPECT_EQ(summary.size(), 2u);
  auto top = summary.top(10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].key, "a");
  EXPECT_EQ(top[1].key, "c");
  EXPECT_EQ(top[1].count, 3u);
  EXPECT_EQ(top[1].error, 2u);
}

TEST(SpaceSavingTest, HeavyHitterSurvivesChurn) {
  SpaceSaving<std::string> summary(4);
  for (int i = 0; i < 200; ++i) {
    summary.offer("heavy");
    summary.offer("noise-" + std::to_string(i));
  }
  auto top = summary.top(1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].key, "heavy");
  EXPECT_GE(top[0].count, 200u);
}

TEST(SpaceSavingTest, MergeSumsCounts) {
  SpaceSaving<std::string> left(3);
  SpaceSaving<std::string> right(3);
  left.offer("x", 4);
  left.offer("y", 1);
  right.offer("x", 2);
  right.offer("z", 7);

  left.merge(right);
  auto top = left.top(3);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].key, "z");
  EXPECT_EQ(top[0].count, 7u);
  EXPECT_EQ(top[1].key, "x");
  EXPECT_EQ(top[1].count, 6u);
  EXPECT_EQ(left.total(), 14u);
}

TEST(SpaceSavingTest, MergeChargesMissingKeysTheFullSummaryMinimum) {
  SpaceSaving<std::string> left(2);
  SpaceSaving<std::string> right(2);
  left.offer("a", 10);
  left.offer("b", 4);
  right.offer("a", 3);
  right.offer("c", 5);
  right.offer("d", 1); // evicts a; right holds c=5 and d=4 (error 3)

  left.merge(right);
  auto top = left.top(10);
  ASSERT_EQ(top.size(), 2u);
  // a: 10 here, absent from right whose minimum is 4
  EXPECT_EQ(top[0].key, "a");
  EXPECT_EQ(top[0].count, 14u);
  EXPECT_EQ(top[0].error, 4u);
  // c: 5 in right, absent from left whose minimum is 4
  EXPECT_EQ(top[1].key, "c");
  EXPECT_EQ(top[1].count, 9u);
  EXPECT_EQ(top[1].error, 4u);
  EXPECT_EQ(left.total(), 23u);

  // Every reported count bounds the true count from above, and count - error
  // bounds it from below
  EXPECT_GE(top[0].count, 13u);
  EXPECT_LE(top[0].count - top[0].error, 13u);
  EXPECT_GE(top[1].count, 5u);
  EXPECT_LE(top[1].count - top[1].error, 5u);
}

TEST(SpaceSavingTest, TiesOrderedByKey) {
  SpaceSaving<std::string> summary(4);
  summary.offer("b");
  summary.offer("a");
  auto top = summary.top(2);
  EXPECT_EQ(top[0].key, "a");
  EXPECT_EQ(top[1].key, "b");
}
