#ifndef UA_CLASSIFIER_HPP
#define UA_CLASSIFIER_HPP

#include "core/log_record.hpp"
#include "utils/aho_corasick.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct UaClassification {
  UaClass ua_class = UaClass::Unknown;
  std::string browser_family;
  std::optional<int> browser_major_version;
};

class UaClassifier {
public:
  virtual ~UaClassifier() = default;
  virtual UaClassification classify(std::string_view user_agent) const = 0;
};

// Substring heuristics: a bot token wins over any browser token
class HeuristicUaClassifier : public UaClassifier {
public:
  explicit HeuristicUaClassifier(std::vector<std::string> bot_substrings);

  UaClassification classify(std::string_view user_agent) const override;

private:
  Utils::AhoCorasick bot_matcher_;
};

namespace UAParser {
// Digits following `browser_token`, e.g. 124 for "Chrome/" in
// "... Chrome/124.0.6367.91 ..."
std::optional<int> get_major_version(std::string_view ua,
                                     std::string_view browser_token);
} // namespace UAParser

#endif // UA_CLASSIFIER_HPP
