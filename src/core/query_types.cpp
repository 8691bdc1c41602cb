#include "query_types.hpp"

bool RecordFilter::matches(const LogRecord &record) const {
  if (client_ip && record.client_ip != *client_ip)
    return false;
  if (status_code && record.status_code != *status_code)
    return false;
  if (method && record.method != *method)
    return false;
  if (endpoint_contains &&
      record.endpoint().find(*endpoint_contains) == std::string::npos)
    return false;
  return true;
}

bool AlertFilter::matches(const Alert &alert) const {
  if (attack_type && alert.attack_type != *attack_type)
    return false;
  if (client_ip && alert.client_ip != *client_ip)
    return false;
  if (min_confidence && alert.confidence < *min_confidence)
    return false;
  return true;
}
