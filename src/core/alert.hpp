#ifndef ALERT_HPP
#define ALERT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class AttackType {
  SQLInjection,
  XSS,
  PathTraversal,
  BruteForce,
  DoS,
  DataExfiltration
};

const char *attack_type_to_string(AttackType type);
std::optional<AttackType> attack_type_from_string(std::string_view name);

// Types produced by the signature classifier, as opposed to behavioral ones
bool is_signature_attack_type(AttackType type);

// Stands in for client_ip or endpoint when a hit covers all of them
constexpr const char *WILDCARD_KEY = "*";

struct SignatureHit {
  AttackType attack_type;
  double confidence = 0.0;
  // Matching rules in declaration order, each counted once
  std::vector<std::string> rule_ids;
  std::string evidence;

  bool operator==(const SignatureHit &other) const;
};

struct BehaviorHit {
  AttackType attack_type;
  std::string client_ip;
  std::string endpoint;
  double confidence = 0.0;
  double observed = 0.0;
  double threshold = 0.0;
  std::string evidence;
};

struct Alert {
  std::string id;
  uint64_t timestamp_ms = 0;
  AttackType attack_type = AttackType::SQLInjection;
  std::string client_ip;
  std::string endpoint;
  double confidence = 0.0;
  std::string evidence;
  std::vector<std::string> source_record_ids;

  uint64_t trigger_count = 1;
  uint64_t last_trigger_ms = 0;
};

// Deterministic id over the coalescing identity and its first trigger time
std::string make_alert_id(AttackType type, std::string_view client_ip,
                          std::string_view endpoint, uint64_t bucket_ms);

#endif // ALERT_HPP
