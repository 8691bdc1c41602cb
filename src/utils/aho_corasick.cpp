#include "aho_corasick.hpp"

#include <queue>

namespace Utils {

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns)
    : patterns_(patterns) {
  trie_.emplace_back(); // Root node

  // 1. Build the basic trie structure
  for (size_t i = 0; i < patterns.size(); ++i) {
    if (patterns[i].empty())
      continue;
    int node = 0;
    for (char ch : patterns[i]) {
      auto it = trie_[node].children.find(ch);
      if (it == trie_[node].children.end()) {
        int next = static_cast<int>(trie_.size());
        trie_[node].children[ch] = next;
        trie_.emplace_back();
        node = next;
      } else {
        node = it->second;
      }
    }
    trie_[node].pattern_indices.push_back(i);
  }

  // 2. Build suffix and output links using BFS
  std::queue<int> q;
  for (auto const &[key, val] : trie_[0].children)
    q.push(val);

  while (!q.empty()) {
    int u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      if (u != 0) {
        int j = trie_[u].suffix_link;
        while (j > 0 && trie_[j].children.count(ch) == 0)
          j = trie_[j].suffix_link;
        auto it = trie_[j].children.find(ch);
        if (it != trie_[j].children.end() && it->second != v)
          trie_[v].suffix_link = it->second;
      }
      q.push(v);
    }

    int suffix_node = trie_[u].suffix_link;
    if (!trie_[suffix_node].pattern_indices.empty())
      trie_[u].output_link = suffix_node;
    else
      trie_[u].output_link = trie_[suffix_node].output_link;
  }
}

int AhoCorasick::step(int node, char ch) const {
  while (node > 0 && trie_[node].children.count(ch) == 0)
    node = trie_[node].suffix_link;
  auto it = trie_[node].children.find(ch);
  return it != trie_[node].children.end() ? it->second : 0;
}

std::vector<size_t>
AhoCorasick::find_pattern_indices(std::string_view text) const {
  std::vector<bool> seen(patterns_.size(), false);
  int current_node = 0;

  for (char ch : text) {
    current_node = step(current_node, ch);
    for (int node = current_node; node > 0; node = trie_[node].output_link)
      for (size_t index : trie_[node].pattern_indices)
        seen[index] = true;
  }

  std::vector<size_t> found;
  for (size_t i = 0; i < seen.size(); ++i)
    if (seen[i])
      found.push_back(i);
  return found;
}

bool AhoCorasick::contains_any(std::string_view text) const {
  int current_node = 0;
  for (char ch : text) {
    current_node = step(current_node, ch);
    if (!trie_[current_node].pattern_indices.empty() ||
        trie_[current_node].output_link > 0)
      return true;
  }
  return false;
}

} // namespace Utils
