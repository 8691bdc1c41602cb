#ifndef DEFAULT_SIGNATURE_RULES_HPP
#define DEFAULT_SIGNATURE_RULES_HPP

#include "core/alert.hpp"

#include <string>
#include <vector>

struct DefaultSignatureRule {
  std::string id;
  AttackType attack_type;
  double confidence;
  bool match_raw;
  std::string pattern;
  // Lower-case literals, one of which must occur for the regex to be tried
  std::vector<std::string> anchors;
};

// Built-in SQL injection, XSS and path traversal rules, in declaration order
const std::vector<DefaultSignatureRule> &default_signature_rules();

#endif // DEFAULT_SIGNATURE_RULES_HPP
