#include "signature_classifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "default_signature_rules.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace {

constexpr double MAX_SIGNATURE_CONFIDENCE = 0.99;
constexpr size_t MAX_EVIDENCE_SNIPPET = 80;

std::regex compile_rule_pattern(const std::string &id,
                                const std::string &pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase |
                                   std::regex::optimize);
  } catch (const std::regex_error &e) {
    throw ClassifierConfigError("Signature rule '" + id +
                                "' pattern does not compile: " + e.what());
  }
}

SignatureRule rule_from_spec(const Config::SignatureRuleSpec &spec) {
  auto type = attack_type_from_string(spec.attack_type);
  if (!type || !is_signature_attack_type(*type))
    throw ClassifierConfigError("Signature rule '" + spec.id +
                                "' has unknown attack type '" +
                                spec.attack_type + "'");
  if (spec.confidence <= 0.0 || spec.confidence > 1.0)
    throw ClassifierConfigError("Signature rule '" + spec.id +
                                "' confidence must be in (0, 1]");
  if (spec.pattern.empty())
    throw ClassifierConfigError("Signature rule '" + spec.id +
                                "' has an empty pattern");

  SignatureRule rule;
  rule.id = spec.id;
  rule.attack_type = *type;
  rule.confidence = spec.confidence;
  rule.match_raw = spec.match_raw;
  rule.pattern = spec.pattern;
  rule.compiled = compile_rule_pattern(spec.id, spec.pattern);
  return rule;
}

std::string snippet(const std::string &text) {
  if (text.size() <= MAX_EVIDENCE_SNIPPET)
    return text;
  return text.substr(0, MAX_EVIDENCE_SNIPPET) + "...";
}

} // namespace

SignatureClassifier::SignatureClassifier(const Config::SignatureConfig &config)
    : enabled_(config.enabled), max_decode_passes_(config.max_decode_passes) {
  std::set<std::string> disabled(config.disabled_rules.begin(),
                                 config.disabled_rules.end());
  std::map<std::string, const Config::SignatureRuleSpec *> overrides;
  for (const auto &spec : config.custom_rules)
    overrides[spec.id] = &spec;

  for (const auto &builtin : default_signature_rules()) {
    if (disabled.count(builtin.id))
      continue;
    auto override_it = overrides.find(builtin.id);
    if (override_it != overrides.end()) {
      // A configured rule with a built-in id replaces it in place
      rules_.push_back(rule_from_spec(*override_it->second));
      overrides.erase(override_it);
      continue;
    }
    SignatureRule rule;
    rule.id = builtin.id;
    rule.attack_type = builtin.attack_type;
    rule.confidence = builtin.confidence;
    rule.match_raw = builtin.match_raw;
    rule.pattern = builtin.pattern;
    rule.compiled = compile_rule_pattern(builtin.id, builtin.pattern);
    rule.anchors = builtin.anchors;
    rules_.push_back(std::move(rule));
  }

  size_t custom_count = 0;
  for (const auto &spec : config.custom_rules) {
    auto it = overrides.find(spec.id);
    if (disabled.count(spec.id) || it == overrides.end())
      continue;
    // The last definition of a repeated id wins
    rules_.push_back(rule_from_spec(*it->second));
    overrides.erase(it);
    ++custom_count;
  }

  std::set<std::string> known_ids;
  for (const auto &builtin : default_signature_rules())
    known_ids.insert(builtin.id);
  for (const auto &spec : config.custom_rules)
    known_ids.insert(spec.id);
  for (const auto &id : disabled)
    if (!known_ids.count(id))
      LOG(LogLevel::WARN, LogComponent::SIGNATURE,
          "Disabled signature rule '" << id << "' does not exist");

  // Group rules by attack type, keeping declaration order within a type
  std::stable_sort(rules_.begin(), rules_.end(),
                   [](const SignatureRule &a, const SignatureRule &b) {
                     return static_cast<int>(a.attack_type) <
                            static_cast<int>(b.attack_type);
                   });

  std::vector<std::string> anchors;
  for (size_t i = 0; i < rules_.size(); ++i) {
    if (rules_[i].anchors.empty()) {
      unanchored_rules_.push_back(i);
      continue;
    }
    for (const auto &anchor : rules_[i].anchors) {
      auto existing = std::find(anchors.begin(), anchors.end(), anchor);
      size_t index = static_cast<size_t>(existing - anchors.begin());
      if (existing == anchors.end()) {
        anchors.push_back(anchor);
        anchor_rules_.emplace_back();
      }
      anchor_rules_[index].push_back(i);
    }
  }
  anchor_matcher_ = Utils::AhoCorasick(anchors);

  LOG(LogLevel::INFO, LogComponent::SIGNATURE,
      "Signature classifier ready with "
          << rules_.size() << " rules (" << custom_count << " custom, "
          << disabled.size() << " disabled)"
          << (enabled_ ? "" : "; classification is disabled"));
}

std::string SignatureClassifier::normalize(std::string_view text,
                                           int max_decode_passes,
                                           bool plus_as_space) {
  std::string decoded(text);
  for (int pass = 0; pass < max_decode_passes; ++pass) {
    std::string next = Utils::url_decode(decoded, plus_as_space);
    if (next == decoded)
      break;
    decoded = std::move(next);
  }
  return Utils::collapse_whitespace(Utils::to_lower_copy(decoded));
}

double
SignatureClassifier::combine_confidences(const std::vector<double> &confidences) {
  double miss_probability = 1.0;
  for (double c : confidences)
    miss_probability *= (1.0 - std::clamp(c, 0.0, 1.0));
  return std::min(MAX_SIGNATURE_CONFIDENCE, 1.0 - miss_probability);
}

std::vector<SignatureClassifier::FieldView>
SignatureClassifier::scanned_fields(const LogRecord &record) {
  std::vector<FieldView> fields;
  fields.push_back({"path", record.path, false});
  if (!record.query.empty())
    fields.push_back({"query", record.query, true});
  if (!record.referrer.empty() && record.referrer != "-")
    fields.push_back({"referrer", record.referrer, false});
  if (!record.user_agent.empty() && record.user_agent != "-")
    fields.push_back({"user_agent", record.user_agent, false});

  for (const auto &[key, value] : record.extra_fields) {
    if (key == "request_body" || key == "body")
      fields.push_back({key.c_str(), value, true});
    else if (key.rfind("header_", 0) == 0)
      fields.push_back({key.c_str(), value, false});
  }
  return fields;
}

std::vector<bool>
SignatureClassifier::candidate_rules(const std::string &normalized,
                                     const std::string &raw) const {
  std::vector<bool> candidates(rules_.size(), false);
  for (size_t index : unanchored_rules_)
    candidates[index] = true;
  for (const std::string *text : {&normalized, &raw})
    for (size_t anchor : anchor_matcher_.find_pattern_indices(*text))
      for (size_t rule : anchor_rules_[anchor])
        candidates[rule] = true;
  return candidates;
}

std::vector<SignatureHit>
SignatureClassifier::classify(const LogRecord &record) const {
  std::vector<SignatureHit> hits;
  if (!enabled_ || rules_.empty())
    return hits;

  // First matching field per rule, as "field: snippet"
  std::vector<std::string> rule_evidence(rules_.size());
  std::vector<bool> matched(rules_.size(), false);

  for (const auto &field : scanned_fields(record)) {
    if (field.text.empty())
      continue;
    std::string normalized =
        normalize(field.text, max_decode_passes_, field.form_encoded);
    std::string raw = Utils::to_lower_copy(field.text);
    std::vector<bool> candidates = candidate_rules(normalized, raw);

    for (size_t i = 0; i < rules_.size(); ++i) {
      if (matched[i] || !candidates[i])
        continue;
      const SignatureRule &rule = rules_[i];
      const std::string &text = rule.match_raw ? raw : normalized;
      std::smatch match;
      if (std::regex_search(text, match, rule.compiled)) {
        matched[i] = true;
        rule_evidence[i] =
            std::string(field.name) + ": '" + snippet(match.str(0)) + "'";
      }
    }
  }

  for (size_t i = 0; i < rules_.size();) {
    AttackType type = rules_[i].attack_type;
    SignatureHit hit{type, 0.0, {}, ""};
    std::vector<double> confidences;
    std::ostringstream evidence;

    for (; i < rules_.size() && rules_[i].attack_type == type; ++i) {
      if (!matched[i])
        continue;
      if (!hit.rule_ids.empty())
        evidence << "; ";
      evidence << rules_[i].id << " on " << rule_evidence[i];
      hit.rule_ids.push_back(rules_[i].id);
      confidences.push_back(rules_[i].confidence);
    }

    if (hit.rule_ids.empty())
      continue;
    hit.confidence = combine_confidences(confidences);
    hit.evidence = evidence.str();
    LOG(LogLevel::DEBUG, LogComponent::SIGNATURE,
        attack_type_to_string(type)
            << " signature hit on " << record.record_id() << " ("
            << hit.confidence << "): " << hit.evidence);
    hits.push_back(std::move(hit));
  }
  return hits;
}
