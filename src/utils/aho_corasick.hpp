#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// Multi-literal matcher. Patterns are matched byte for byte, so callers
// lower-case both sides for case-insensitive use.
class AhoCorasick {
public:
  AhoCorasick() : AhoCorasick(std::vector<std::string>{}) {}
  explicit AhoCorasick(const std::vector<std::string> &patterns);

  // Indices (into the constructor's vector) of every pattern occurring in
  // `text`, each reported once, in ascending order
  std::vector<size_t> find_pattern_indices(std::string_view text) const;

  bool contains_any(std::string_view text) const;

  size_t pattern_count() const { return patterns_.size(); }

private:
  struct TrieNode {
    std::unordered_map<char, int> children;
    int suffix_link = 0; // Default to root
    int output_link = 0; // Default to root
    std::vector<size_t> pattern_indices;
  };

  int step(int node, char ch) const;

  std::vector<TrieNode> trie_;
  std::vector<std::string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
