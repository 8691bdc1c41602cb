#include "alert.hpp"
#include "utils/utils.hpp"

#include <string>
#include <tuple>

const char *attack_type_to_string(AttackType type) {
  switch (type) {
  case AttackType::SQLInjection:
    return "SQLInjection";
  case AttackType::XSS:
    return "XSS";
  case AttackType::PathTraversal:
    return "PathTraversal";
  case AttackType::BruteForce:
    return "BruteForce";
  case AttackType::DoS:
    return "DoS";
  case AttackType::DataExfiltration:
    return "DataExfiltration";
  }
  return "Unknown";
}

std::optional<AttackType> attack_type_from_string(std::string_view name) {
  static const AttackType all_types[] = {
      AttackType::SQLInjection, AttackType::XSS,
      AttackType::PathTraversal, AttackType::BruteForce,
      AttackType::DoS,          AttackType::DataExfiltration};

  std::string lowered = Utils::to_lower_copy(name);
  for (AttackType type : all_types)
    if (lowered == Utils::to_lower_copy(attack_type_to_string(type)))
      return type;
  return std::nullopt;
}

bool is_signature_attack_type(AttackType type) {
  return type == AttackType::SQLInjection || type == AttackType::XSS ||
         type == AttackType::PathTraversal;
}

bool SignatureHit::operator==(const SignatureHit &other) const {
  return std::tie(attack_type, confidence, rule_ids, evidence) ==
         std::tie(other.attack_type, other.confidence, other.rule_ids,
                  other.evidence);
}

std::string make_alert_id(AttackType type, std::string_view client_ip,
                          std::string_view endpoint, uint64_t bucket_ms) {
  std::string key;
  key.reserve(client_ip.size() + endpoint.size() + 48);
  key.append(attack_type_to_string(type));
  key.push_back('|');
  key.append(client_ip);
  key.push_back('|');
  key.append(endpoint);
  key.push_back('|');
  key.append(std::to_string(bucket_ms));
  return Utils::to_hex(Utils::fnv1a_64(key));
}
