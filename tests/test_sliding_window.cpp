#include "utils/sliding_window.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace {

// Empties the window, returning its events oldest first
std::vector<std::pair<uint64_t, int>> drain(SlidingWindow<int> &window,
                                            uint64_t far_future) {
  std::vector<std::pair<uint64_t, int>> drained;
  window.prune_old_events(far_future,
                          [&](const SlidingWindow<int>::Element &e) {
                            drained.push_back(e);
                          });
  return drained;
}

} // namespace

TEST(SlidingWindowTest, PrunesCorrectly) {
  // Test that pruning correctly removes old items based on timestamp
  SlidingWindow<int> window(1000, 0); // 1-second window

  window.add_event(100, 1);
  window.add_event(200, 2);
  window.add_event(1100, 3);
  window.add_event(1200, 4);

  // Cutoff is 150ms, the event at 100 goes
  int evicted_value = 0;
  auto remember = [&](const SlidingWindow<int>::Element &e) {
    evicted_value = e.second;
  };
  EXPECT_EQ(window.prune_old_events(1150, remember), 1u);
  EXPECT_EQ(evicted_value, 1);
  ASSERT_EQ(window.get_event_count(), 3u)
      << "Should keep events at 200, 1100, 1200";

  // Cutoff is 1100ms, an event exactly on it stays
  EXPECT_EQ(window.prune_old_events(2100, remember), 1u);
  EXPECT_EQ(evicted_value, 2);
  ASSERT_EQ(window.get_event_count(), 2u);

  window.prune_old_events(3000);
  EXPECT_TRUE(window.is_empty());
}

TEST(SlidingWindowTest, HandlesEmptyWindow) {
  SlidingWindow<int> window(1000, 0);
  ASSERT_NO_THROW(window.prune_old_events(5000));
  EXPECT_EQ(window.get_event_count(), 0u);
  EXPECT_TRUE(window.is_empty());
}

TEST(SlidingWindowTest, InsertsLateEventsInOrder) {
  SlidingWindow<int> window(10000);
  window.add_event(3000, 3);
  window.add_event(1000, 1);
  window.add_event(2000, 2);

  window.add_event(2000, 22); // equal timestamps keep arrival order

  auto events = drain(window, 1000000);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0], std::make_pair(uint64_t{1000}, 1));
  EXPECT_EQ(events[1], std::make_pair(uint64_t{2000}, 2));
  EXPECT_EQ(events[2], std::make_pair(uint64_t{2000}, 22));
  EXPECT_EQ(events[3], std::make_pair(uint64_t{3000}, 3));
  EXPECT_TRUE(window.is_empty());
}

TEST(SlidingWindowTest, EnforcesSizeLimitAndReportsEvictions) {
  SlidingWindow<int> window(0, 2); // no time limit
  window.add_event(1, 10);
  window.add_event(2, 20);
  window.add_event(3, 30);

  int evicted_sum = 0;
  size_t evicted = window.prune_old_events(
      100, [&](const SlidingWindow<int>::Element &e) { evicted_sum += e.second; });
  EXPECT_EQ(evicted, 1u);
  EXPECT_EQ(evicted_sum, 10);
  EXPECT_EQ(window.get_event_count(), 2u);
}

TEST(SlidingWindowTest, NoUnderflowBeforeDuration) {
  SlidingWindow<int> window(5000);
  window.add_event(0, 1);
  window.prune_old_events(1000);
  EXPECT_EQ(window.get_event_count(), 1u);
}
