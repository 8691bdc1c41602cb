#include "config.hpp"
#include "alert.hpp"
#include "errors.hpp"
#include "log_parser.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace Config {

uint64_t BehaviorConfig::longest_window_ms() const {
  return std::max({auth_window_seconds, rate_window_seconds,
                   transfer_window_seconds}) *
         1000;
}

uint64_t BehaviorConfig::effective_eviction_ttl_ms() const {
  if (eviction_ttl_seconds > 0)
    return eviction_ttl_seconds * 1000;
  return longest_window_ms() * 10;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.store", LogComponent::IO_STORE},
    {"io.live", LogComponent::IO_LIVE},
    {"io.web", LogComponent::IO_WEB},
    {"parser", LogComponent::PARSER},
    {"enrichment", LogComponent::ENRICHMENT},
    {"detect.signature", LogComponent::SIGNATURE},
    {"detect.behavior", LogComponent::BEHAVIOR},
    {"alerting", LogComponent::ALERTING},
    {"metrics", LogComponent::METRICS},
    {"pipeline", LogComponent::PIPELINE},
    {"integrity", LogComponent::INTEGRITY}};

// Common truthy and falsy spellings; nullopt for anything else
std::optional<bool> string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  if (val_str == "true" || val_str == "1" || val_str == "yes" ||
      val_str == "on")
    return true;
  if (val_str == "false" || val_str == "0" || val_str == "no" ||
      val_str == "off")
    return false;
  return std::nullopt;
}

template <typename T> const char *expected_number_kind() {
  if (std::is_floating_point<T>::value)
    return "a number";
  if (std::is_signed<T>::value)
    return "a whole number";
  return "a non-negative whole number";
}

std::vector<std::string> parse_string_list(const std::string &value) {
  std::vector<std::string> items;
  std::string item;
  std::istringstream stream(value);
  while (std::getline(stream, item, ',')) {
    std::string trimmed = Utils::trim_copy(item);
    if (!trimmed.empty())
      items.push_back(trimmed);
  }
  return items;
}

bool starts_with(const std::string &text, const char *prefix) {
  return text.rfind(prefix, 0) == 0;
}

// "strict|<regex>" or "loose|<regex>"
std::optional<FormatSpec> parse_format_spec(const std::string &name,
                                            const std::string &value) {
  size_t bar = value.find('|');
  if (bar == std::string::npos)
    return std::nullopt;
  std::string mode = Utils::to_lower_copy(Utils::trim_copy(value.substr(0, bar)));
  if (mode != "strict" && mode != "loose")
    return std::nullopt;
  FormatSpec spec;
  spec.name = name;
  spec.strict = mode == "strict";
  spec.pattern = value.substr(bar + 1);
  return spec;
}

// "<type>|<confidence>|<flags>|<regex>"; the regex may itself contain '|'
std::optional<SignatureRuleSpec> parse_rule_spec(const std::string &id,
                                                 const std::string &value) {
  size_t first = value.find('|');
  if (first == std::string::npos)
    return std::nullopt;
  size_t second = value.find('|', first + 1);
  if (second == std::string::npos)
    return std::nullopt;
  size_t third = value.find('|', second + 1);
  if (third == std::string::npos)
    return std::nullopt;

  SignatureRuleSpec spec;
  spec.id = id;
  spec.attack_type = Utils::trim_copy(value.substr(0, first));
  auto confidence = Utils::string_to_number<double>(
      Utils::trim_copy(value.substr(first + 1, second - first - 1)));
  if (!confidence)
    return std::nullopt;
  spec.confidence = *confidence;
  std::string flags = Utils::to_lower_copy(
      Utils::trim_copy(value.substr(second + 1, third - second - 1)));
  spec.match_raw = flags == "raw";
  spec.pattern = value.substr(third + 1);
  return spec;
}

// Validation functions for configuration parameters
bool validate_ingestion_config(const IngestionConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (config.queue_capacity < 1) {
    errors.push_back("Ingestion queue capacity must be at least 1");
    valid = false;
  }
  if (config.shard_queue_capacity < 1) {
    errors.push_back("Shard queue capacity must be at least 1");
    valid = false;
  }
  if (config.parse_workers < 1 || config.parse_workers > 64) {
    errors.push_back("Parse worker count must be between 1 and 64");
    valid = false;
  }
  if (config.shard_count < 1 || config.shard_count > 256) {
    errors.push_back("Shard count must be between 1 and 256");
    valid = false;
  }
  if (config.max_line_length < 64) {
    errors.push_back("Maximum line length must be at least 64 bytes");
    valid = false;
  }
  if (config.sweep_interval_events < 1) {
    errors.push_back("Sweep interval must be at least 1 event");
    valid = false;
  }

  return valid;
}

bool validate_formats_config(const FormatsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.priority.empty()) {
    errors.push_back("At least one log format must be listed in priority");
    valid = false;
  }

  try {
    resolve_formats(config);
  } catch (const ClassifierConfigError &e) {
    errors.push_back(e.what());
    valid = false;
  }

  return valid;
}

bool validate_behavior_config(const BehaviorConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.auth_window_seconds < 1 || config.rate_window_seconds < 1 ||
      config.transfer_window_seconds < 1) {
    errors.push_back("Behavioral window durations must be at least 1 second");
    valid = false;
  }
  if (config.auth_failure_threshold < 1 || config.request_rate_threshold < 1 ||
      config.endpoint_rate_threshold < 1 || config.bytes_threshold < 1) {
    errors.push_back("Behavioral thresholds must be positive");
    valid = false;
  }
  if (config.bruteforce_max_distinct_endpoints < 1) {
    errors.push_back("Brute force endpoint diversity limit must be positive");
    valid = false;
  }
  if (config.dos_auth_failure_share <= 0.0 ||
      config.dos_auth_failure_share > 1.0) {
    errors.push_back("DoS auth failure share must be in (0, 1]");
    valid = false;
  }
  if (config.outlier_stddev_multiplier <= 0.0) {
    errors.push_back("Outlier standard deviation multiplier must be positive");
    valid = false;
  }
  if (config.baseline_alpha <= 0.0 || config.baseline_alpha > 1.0) {
    errors.push_back("Baseline alpha must be in (0, 1]");
    valid = false;
  }
  if (config.baseline_min_samples < 2) {
    errors.push_back("Baseline needs at least 2 samples");
    valid = false;
  }
  if (config.eviction_ttl_seconds > 0 &&
      config.eviction_ttl_seconds * 1000 < config.longest_window_ms()) {
    errors.push_back("Eviction TTL must not be shorter than the longest window");
    valid = false;
  }
  if (config.max_events_per_window < 1 || config.max_tracked_endpoints < 1 ||
      config.max_endpoint_pairs_per_ip < 1) {
    errors.push_back("Behavioral state limits must be positive");
    valid = false;
  }
  if (config.confidence_floor < 0.0 || config.confidence_floor > 1.0) {
    errors.push_back("Confidence floor must be between 0 and 1");
    valid = false;
  }
  if (config.saturation_ratio <= 1.0) {
    errors.push_back("Saturation ratio must be greater than 1");
    valid = false;
  }

  return valid;
}

bool validate_signature_config(const SignatureConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_decode_passes < 0 || config.max_decode_passes > 5) {
    errors.push_back("Signature max_decode_passes must be between 0 and 5");
    valid = false;
  }

  for (const auto &rule : config.custom_rules) {
    auto type = attack_type_from_string(rule.attack_type);
    if (!type || !is_signature_attack_type(*type)) {
      errors.push_back("Signature rule '" + rule.id +
                       "' has unknown attack type '" + rule.attack_type + "'");
      valid = false;
    }
    if (rule.confidence <= 0.0 || rule.confidence > 1.0) {
      errors.push_back("Signature rule '" + rule.id +
                       "' confidence must be in (0, 1]");
      valid = false;
    }
    if (rule.pattern.empty()) {
      errors.push_back("Signature rule '" + rule.id + "' has an empty pattern");
      valid = false;
      continue;
    }
    try {
      std::regex compiled(rule.pattern, std::regex::ECMAScript |
                                            std::regex::icase |
                                            std::regex::optimize);
    } catch (const std::regex_error &e) {
      errors.push_back("Signature rule '" + rule.id +
                       "' pattern does not compile: " + e.what());
      valid = false;
    }
  }

  return valid;
}

bool validate_alerting_config(const AlertingConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.coalescing_interval_seconds < 1) {
    errors.push_back("Coalescing interval must be at least 1 second");
    valid = false;
  }
  if (config.max_source_records_per_alert < 1) {
    errors.push_back("Alerts must keep at least one source record id");
    valid = false;
  }
  if (config.corroboration_min_triggers < 2) {
    errors.push_back("Corroboration needs at least 2 triggers");
    valid = false;
  }
  if (config.corroboration_bonus < 0.0 || config.corroboration_bonus > 1.0) {
    errors.push_back("Corroboration bonus must be between 0 and 1");
    valid = false;
  }
  if (config.coalescing_stripes < 1) {
    errors.push_back("Coalescing stripe count must be positive");
    valid = false;
  }

  return valid;
}

bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.unique_clients_exact_cap < 1) {
    errors.push_back("Unique client exact cap must be positive");
    valid = false;
  }
  if (config.top_k_capacity < 1) {
    errors.push_back("Top-K capacity must be positive");
    valid = false;
  }
  if (config.max_user_agent_length < 1) {
    errors.push_back("Maximum user agent length must be positive");
    valid = false;
  }

  return valid;
}

bool validate_enrichment_config(const EnrichmentConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (!config.geo_http_endpoint.empty() &&
      config.geo_http_endpoint.rfind("http://", 0) != 0 &&
      config.geo_http_endpoint.rfind("https://", 0) != 0) {
    errors.push_back("Geo lookup endpoint must be an http(s) URL");
    valid = false;
  }
  if (config.geo_http_timeout_ms < 1) {
    errors.push_back("Geo lookup timeout must be at least 1 ms");
    valid = false;
  }
  if (config.geo_failure_threshold < 1) {
    errors.push_back("Geo lookup failure threshold must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_storage_config(const StorageConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.backend != "memory" && config.backend != "mongodb") {
    errors.push_back("Storage backend must be one of: memory, mongodb");
    valid = false;
  }
  if (config.backend == "mongodb" &&
      (config.mongo_uri.empty() || config.mongo_database.empty())) {
    errors.push_back("MongoDB storage needs a URI and a database name");
    valid = false;
  }

  return valid;
}

bool validate_web_server_config(const WebServerConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Web server port must be between 1 and 65535");
    valid = false;
  }
  if (config.subscriber_queue_capacity < 1) {
    errors.push_back("Live subscriber queue capacity must be positive");
    valid = false;
  }
  if (config.heartbeat_seconds < 1) {
    errors.push_back("Live heartbeat interval must be at least 1 second");
    valid = false;
  }
  if (config.max_page_size < 1 || config.max_page_size > 1000) {
    errors.push_back("Maximum page size must be between 1 and 1000");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid = validate_ingestion_config(config.ingestion, errors) && valid;
  valid = validate_formats_config(config.formats, errors) && valid;
  valid = validate_behavior_config(config.behavior, errors) && valid;
  valid = validate_signature_config(config.signatures, errors) && valid;
  valid = validate_alerting_config(config.alerting, errors) && valid;
  valid = validate_metrics_config(config.metrics, errors) && valid;
  valid = validate_enrichment_config(config.enrichment, errors) && valid;
  valid = validate_storage_config(config.storage, errors) && valid;
  valid = validate_web_server_config(config.web_server, errors) && valid;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE and PIPELINE, which report progress at INFO
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  config.logging.log_levels[LogComponent::PIPELINE] = LogLevel::INFO;

  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // A value that does not parse is an error, never a silent default
    auto reject = [&](const char *expected) {
      errors.push_back("Line " + std::to_string(line_num) + ": [" +
                       current_section + "] " + key + " expects " + expected +
                       ", got '" + value + "'");
    };
    auto read_number = [&](auto &field) {
      using T = std::decay_t<decltype(field)>;
      if (auto parsed = Utils::string_to_number<T>(value))
        field = *parsed;
      else
        reject(expected_number_kind<T>());
    };
    auto read_bool = [&](bool &field) {
      if (auto parsed = string_to_bool(value))
        field = *parsed;
      else
        reject("true or false");
    };

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::BATCH_INPUT_PATHS)
          config.batch_input_paths = parse_string_list(value);
        else if (key == Keys::LIVE_INPUT_PATH)
          config.live_input_path = value;
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Ingestion") {
        auto &ing = config.ingestion;
        if (key == Keys::ING_QUEUE_CAPACITY)
          read_number(ing.queue_capacity);
        else if (key == Keys::ING_PARSE_WORKERS)
          read_number(ing.parse_workers);
        else if (key == Keys::ING_SHARD_COUNT)
          read_number(ing.shard_count);
        else if (key == Keys::ING_SHARD_QUEUE_CAPACITY)
          read_number(ing.shard_queue_capacity);
        else if (key == Keys::ING_LIVE_POLL_INTERVAL_MS)
          read_number(ing.live_poll_interval_ms);
        else if (key == Keys::ING_MAX_LINE_LENGTH)
          read_number(ing.max_line_length);
        else if (key == Keys::ING_SWEEP_INTERVAL_EVENTS)
          read_number(ing.sweep_interval_events);

      } else if (current_section == "Formats") {
        if (key == Keys::FMT_PRIORITY) {
          config.formats.priority = parse_string_list(value);
        } else if (starts_with(key, Keys::FMT_FORMAT_PREFIX)) {
          std::string name = key.substr(std::string(Keys::FMT_FORMAT_PREFIX).size());
          if (auto spec = parse_format_spec(name, value))
            config.formats.custom_formats[name] = *spec;
          else
            throw ClassifierConfigError("Format '" + name +
                                        "' must be written as "
                                        "'strict|<pattern>' or "
                                        "'loose|<pattern>'");
        } else if (starts_with(key, Keys::FMT_JSON_FIELD_PREFIX)) {
          std::string field =
              key.substr(std::string(Keys::FMT_JSON_FIELD_PREFIX).size());
          config.formats.json_field_keys[field] = parse_string_list(value);
        }

      } else if (current_section == "Behavior") {
        auto &bh = config.behavior;
        if (key == Keys::BH_AUTH_WINDOW_SECONDS)
          read_number(bh.auth_window_seconds);
        else if (key == Keys::BH_AUTH_THRESHOLD)
          read_number(bh.auth_failure_threshold);
        else if (key == Keys::BH_BRUTEFORCE_MAX_DISTINCT_ENDPOINTS)
          read_number(bh.bruteforce_max_distinct_endpoints);
        else if (key == Keys::BH_RATE_WINDOW_SECONDS)
          read_number(bh.rate_window_seconds);
        else if (key == Keys::BH_RATE_THRESHOLD)
          read_number(bh.request_rate_threshold);
        else if (key == Keys::BH_ENDPOINT_RATE_THRESHOLD)
          read_number(bh.endpoint_rate_threshold);
        else if (key == Keys::BH_DOS_AUTH_FAILURE_SHARE)
          read_number(bh.dos_auth_failure_share);
        else if (key == Keys::BH_TRANSFER_WINDOW_SECONDS)
          read_number(bh.transfer_window_seconds);
        else if (key == Keys::BH_BYTES_THRESHOLD)
          read_number(bh.bytes_threshold);
        else if (key == Keys::BH_OUTLIER_MIN_BYTES)
          read_number(bh.outlier_min_bytes);
        else if (key == Keys::BH_OUTLIER_STDDEV_MULTIPLIER)
          read_number(bh.outlier_stddev_multiplier);
        else if (key == Keys::BH_BASELINE_MIN_SAMPLES)
          read_number(bh.baseline_min_samples);
        else if (key == Keys::BH_BASELINE_ALPHA)
          read_number(bh.baseline_alpha);
        else if (key == Keys::BH_EVICTION_TTL_SECONDS)
          read_number(bh.eviction_ttl_seconds);
        else if (key == Keys::BH_MAX_EVENTS_PER_WINDOW)
          read_number(bh.max_events_per_window);
        else if (key == Keys::BH_MAX_TRACKED_ENDPOINTS)
          read_number(bh.max_tracked_endpoints);
        else if (key == Keys::BH_MAX_PAIRS_PER_IP)
          read_number(bh.max_endpoint_pairs_per_ip);
        else if (key == Keys::BH_CONFIDENCE_FLOOR)
          read_number(bh.confidence_floor);
        else if (key == Keys::BH_SATURATION_RATIO)
          read_number(bh.saturation_ratio);

      } else if (current_section == "SignatureRules") {
        auto &sig = config.signatures;
        if (key == Keys::SIG_ENABLED) {
          read_bool(sig.enabled);
        } else if (key == Keys::SIG_MAX_DECODE_PASSES) {
          read_number(sig.max_decode_passes);
        } else if (key == Keys::SIG_DISABLE) {
          sig.disabled_rules = parse_string_list(value);
        } else if (starts_with(key, Keys::SIG_RULE_PREFIX)) {
          std::string id = key.substr(std::string(Keys::SIG_RULE_PREFIX).size());
          if (auto spec = parse_rule_spec(id, value))
            sig.custom_rules.push_back(*spec);
          else
            throw ClassifierConfigError(
                "Signature rule '" + id +
                "' must be written as '<type>|<confidence>|<flags>|<pattern>'");
        }

      } else if (current_section == "Alerting") {
        auto &al = config.alerting;
        if (key == Keys::AL_COALESCING_INTERVAL_SECONDS)
          read_number(al.coalescing_interval_seconds);
        else if (key == Keys::AL_MAX_SOURCE_RECORDS)
          read_number(al.max_source_records_per_alert);
        else if (key == Keys::AL_CORROBORATION_MIN_TRIGGERS)
          read_number(al.corroboration_min_triggers);
        else if (key == Keys::AL_CORROBORATION_BONUS)
          read_number(al.corroboration_bonus);
        else if (key == Keys::AL_COALESCING_STRIPES)
          read_number(al.coalescing_stripes);

      } else if (current_section == "Metrics") {
        auto &mt = config.metrics;
        if (key == Keys::MT_UNIQUE_CLIENTS_EXACT_CAP)
          read_number(mt.unique_clients_exact_cap);
        else if (key == Keys::MT_TOP_K_CAPACITY)
          read_number(mt.top_k_capacity);
        else if (key == Keys::MT_MAX_USER_AGENT_LENGTH)
          read_number(mt.max_user_agent_length);

      } else if (current_section == "Enrichment") {
        auto &en = config.enrichment;
        if (key == Keys::EN_GEO_CIDR_FILE)
          en.geo_cidr_file = value;
        else if (key == Keys::EN_GEO_HTTP_ENDPOINT)
          en.geo_http_endpoint = value;
        else if (key == Keys::EN_GEO_HTTP_TIMEOUT_MS)
          read_number(en.geo_http_timeout_ms);
        else if (key == Keys::EN_GEO_CACHE_SIZE)
          read_number(en.geo_cache_size);
        else if (key == Keys::EN_GEO_FAILURE_THRESHOLD)
          read_number(en.geo_failure_threshold);
        else if (key == Keys::EN_GEO_COOLDOWN_MS)
          read_number(en.geo_cooldown_ms);
        else if (key == Keys::EN_BOT_UA_SUBSTRINGS) {
          en.bot_ua_substrings.clear();
          for (const auto &item : parse_string_list(value))
            en.bot_ua_substrings.push_back(Utils::to_lower_copy(item));
        }

      } else if (current_section == "Storage") {
        if (key == Keys::ST_BACKEND)
          config.storage.backend = Utils::to_lower_copy(value);
        else if (key == Keys::ST_MONGO_URI)
          config.storage.mongo_uri = value;
        else if (key == Keys::ST_MONGO_DATABASE)
          config.storage.mongo_database = value;

      } else if (current_section == "WebServer") {
        auto &ws = config.web_server;
        if (key == Keys::WS_ENABLED)
          read_bool(ws.enabled);
        else if (key == Keys::WS_HOST)
          ws.host = value;
        else if (key == Keys::WS_PORT)
          read_number(ws.port);
        else if (key == Keys::WS_SUBSCRIBER_QUEUE_CAPACITY)
          read_number(ws.subscriber_queue_capacity);
        else if (key == Keys::WS_HEARTBEAT_SECONDS)
          read_number(ws.heartbeat_seconds);
        else if (key == Keys::WS_MAX_PAGE_SIZE)
          read_number(ws.max_page_size);

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "io.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }
      }
    } catch (const ClassifierConfigError &) {
      throw;
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Could not parse value for key '" << key << "' - "
                << e.what() << std::endl;
    }
  }

  return true;
}

namespace {

std::shared_ptr<AppConfig> parse_and_validate(const std::string &filepath,
                                              std::vector<std::string> &errors) {
  auto new_config = std::make_shared<AppConfig>();
  try {
    if (!parse_config_into(filepath, *new_config, errors)) {
      errors.push_back("Could not read configuration file: " + filepath);
      return nullptr;
    }
  } catch (const ClassifierConfigError &e) {
    errors.push_back(e.what());
    return nullptr;
  }

  // Value errors are reported together with the validation messages
  bool parsed_cleanly = errors.empty();
  if (!validate_app_config(*new_config, errors) || !parsed_cleanly)
    return nullptr;
  return new_config;
}

} // namespace

bool ConfigManager::load_configuration(const std::string &filepath) {
  std::vector<std::string> errors;
  auto new_config = parse_and_validate(filepath, errors);
  if (!new_config) {
    LOG(LogLevel::ERROR, LogComponent::CONFIG,
        "Configuration from " << filepath
                              << " rejected, keeping existing settings:");
    for (const auto &error : errors)
      LOG(LogLevel::ERROR, LogComponent::CONFIG, "  - " << error);
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_filepath_ = filepath;
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

void ConfigManager::load_configuration_or_throw(const std::string &filepath) {
  std::vector<std::string> errors;
  auto new_config = parse_and_validate(filepath, errors);
  if (!new_config) {
    std::ostringstream message;
    message << "Invalid configuration in " << filepath << ":";
    for (const auto &error : errors)
      message << "\n  - " << error;
    throw ClassifierConfigError(message.str(), errors);
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  config_filepath_ = filepath;
  current_config_ = new_config;
}

bool ConfigManager::reload() {
  std::string path = get_config_path();
  if (path.empty())
    return false;
  return load_configuration(path);
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

std::string ConfigManager::get_config_path() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_filepath_;
}

} // namespace Config
