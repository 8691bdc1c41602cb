#include "utils/aho_corasick.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(AhoCorasickTest, FindsOverlappingPatterns) {
  Utils::AhoCorasick matcher({"he", "she", "his", "hers"});
  auto hits = matcher.find_pattern_indices("ushers");
  std::vector<size_t> expected{0, 1, 3};
  EXPECT_EQ(hits, expected);
}

TEST(AhoCorasickTest, ReportsEachPatternOnce) {
  Utils::AhoCorasick matcher({"../"});
  auto hits = matcher.find_pattern_indices("/../../../etc/passwd");
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0], 0u);
}

TEST(AhoCorasickTest, NoMatch) {
  Utils::AhoCorasick matcher({"union select", "<script"});
  EXPECT_FALSE(matcher.contains_any("/index.html?page=2"));
  EXPECT_TRUE(matcher.contains_any("q=1 union select password"));
  EXPECT_EQ(matcher.pattern_count(), 2u);
}

TEST(AhoCorasickTest, EmptyMatcher) {
  Utils::AhoCorasick matcher;
  EXPECT_TRUE(matcher.find_pattern_indices("anything").empty());
}

TEST(AhoCorasickTest, PatternIsSuffixOfAnother) {
  Utils::AhoCorasick matcher({"/etc/passwd", "passwd"});
  auto hits = matcher.find_pattern_indices("cat /etc/passwd");
  std::vector<size_t> expected{0, 1};
  EXPECT_EQ(hits, expected);
}
