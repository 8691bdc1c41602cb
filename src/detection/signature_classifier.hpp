#ifndef SIGNATURE_CLASSIFIER_HPP
#define SIGNATURE_CLASSIFIER_HPP

#include "core/alert.hpp"
#include "core/config.hpp"
#include "core/log_record.hpp"
#include "utils/aho_corasick.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

struct SignatureRule {
  std::string id;
  AttackType attack_type = AttackType::SQLInjection;
  double confidence = 0.0;
  // Match against the undecoded text instead of the normalized one
  bool match_raw = false;
  std::string pattern;
  std::regex compiled;
  // Empty means the rule is always evaluated
  std::vector<std::string> anchors;
};

// Stateless pattern matcher over the request fields of a record. Safe to
// share between threads once constructed.
class SignatureClassifier {
public:
  // Built-in rules plus the configured ones, minus the disabled ids. Throws
  // ClassifierConfigError for a rule that does not validate.
  explicit SignatureClassifier(const Config::SignatureConfig &config);

  // One hit per attack type, ordered by attack type
  std::vector<SignatureHit> classify(const LogRecord &record) const;

  const std::vector<SignatureRule> &rules() const { return rules_; }
  bool enabled() const { return enabled_; }

  // Repeated URL decoding (up to `max_decode_passes`), lower-casing and
  // whitespace collapsing
  static std::string normalize(std::string_view text, int max_decode_passes,
                               bool plus_as_space = false);

  // 1 - prod(1 - c), capped at 0.99
  static double combine_confidences(const std::vector<double> &confidences);

private:
  struct FieldView {
    const char *name;
    std::string_view text;
    bool form_encoded;
  };

  static std::vector<FieldView> scanned_fields(const LogRecord &record);
  std::vector<bool> candidate_rules(const std::string &normalized,
                                    const std::string &raw) const;

  bool enabled_;
  int max_decode_passes_;
  std::vector<SignatureRule> rules_;

  Utils::AhoCorasick anchor_matcher_;
  // Anchor index -> rules it unlocks
  std::vector<std::vector<size_t>> anchor_rules_;
  std::vector<size_t> unanchored_rules_;
};

#endif // SIGNATURE_CLASSIFIER_HPP
