#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *BATCH_INPUT_PATHS = "batch_input_paths";
constexpr const char *LIVE_INPUT_PATH = "live_input_path";

// Ingestion Settings
constexpr const char *ING_QUEUE_CAPACITY = "queue_capacity";
constexpr const char *ING_PARSE_WORKERS = "parse_workers";
constexpr const char *ING_SHARD_COUNT = "shard_count";
constexpr const char *ING_SHARD_QUEUE_CAPACITY = "shard_queue_capacity";
constexpr const char *ING_LIVE_POLL_INTERVAL_MS = "live_poll_interval_ms";
constexpr const char *ING_MAX_LINE_LENGTH = "max_line_length";
constexpr const char *ING_SWEEP_INTERVAL_EVENTS = "sweep_interval_events";

// Format Settings
constexpr const char *FMT_PRIORITY = "priority";
constexpr const char *FMT_FORMAT_PREFIX = "format.";
constexpr const char *FMT_JSON_FIELD_PREFIX = "json.";

// Behavior Settings
constexpr const char *BH_AUTH_WINDOW_SECONDS = "auth_window_seconds";
constexpr const char *BH_AUTH_THRESHOLD = "auth_failure_threshold";
constexpr const char *BH_BRUTEFORCE_MAX_DISTINCT_ENDPOINTS =
    "bruteforce_max_distinct_endpoints";
constexpr const char *BH_RATE_WINDOW_SECONDS = "rate_window_seconds";
constexpr const char *BH_RATE_THRESHOLD = "request_rate_threshold";
constexpr const char *BH_ENDPOINT_RATE_THRESHOLD = "endpoint_rate_threshold";
constexpr const char *BH_DOS_AUTH_FAILURE_SHARE = "dos_auth_failure_share";
constexpr const char *BH_TRANSFER_WINDOW_SECONDS = "transfer_window_seconds";
constexpr const char *BH_BYTES_THRESHOLD = "bytes_threshold";
constexpr const char *BH_OUTLIER_MIN_BYTES = "outlier_min_bytes";
constexpr const char *BH_OUTLIER_STDDEV_MULTIPLIER =
    "outlier_stddev_multiplier";
constexpr const char *BH_BASELINE_MIN_SAMPLES = "baseline_min_samples";
constexpr const char *BH_BASELINE_ALPHA = "baseline_alpha";
constexpr const char *BH_EVICTION_TTL_SECONDS = "eviction_ttl_seconds";
constexpr const char *BH_MAX_EVENTS_PER_WINDOW = "max_events_per_window";
constexpr const char *BH_MAX_TRACKED_ENDPOINTS = "max_tracked_endpoints";
constexpr const char *BH_MAX_PAIRS_PER_IP = "max_endpoint_pairs_per_ip";
constexpr const char *BH_CONFIDENCE_FLOOR = "confidence_floor";
constexpr const char *BH_SATURATION_RATIO = "saturation_ratio";

// Signature Rule Settings
constexpr const char *SIG_ENABLED = "enabled";
constexpr const char *SIG_MAX_DECODE_PASSES = "max_decode_passes";
constexpr const char *SIG_DISABLE = "disable";
constexpr const char *SIG_RULE_PREFIX = "rule.";

// Alerting Settings
constexpr const char *AL_COALESCING_INTERVAL_SECONDS =
    "coalescing_interval_seconds";
constexpr const char *AL_MAX_SOURCE_RECORDS = "max_source_records_per_alert";
constexpr const char *AL_CORROBORATION_MIN_TRIGGERS =
    "corroboration_min_triggers";
constexpr const char *AL_CORROBORATION_BONUS = "corroboration_bonus";
constexpr const char *AL_COALESCING_STRIPES = "coalescing_stripes";

// Metrics Settings
constexpr const char *MT_UNIQUE_CLIENTS_EXACT_CAP = "unique_clients_exact_cap";
constexpr const char *MT_TOP_K_CAPACITY = "top_k_capacity";
constexpr const char *MT_MAX_USER_AGENT_LENGTH = "max_user_agent_length";

// Enrichment Settings
constexpr const char *EN_GEO_CIDR_FILE = "geo_cidr_file";
constexpr const char *EN_GEO_HTTP_ENDPOINT = "geo_http_endpoint";
constexpr const char *EN_GEO_HTTP_TIMEOUT_MS = "geo_http_timeout_ms";
constexpr const char *EN_GEO_CACHE_SIZE = "geo_cache_size";
constexpr const char *EN_GEO_FAILURE_THRESHOLD = "geo_failure_threshold";
constexpr const char *EN_GEO_COOLDOWN_MS = "geo_cooldown_ms";
constexpr const char *EN_BOT_UA_SUBSTRINGS = "bot_ua_substrings";

// Storage Settings
constexpr const char *ST_BACKEND = "backend";
constexpr const char *ST_MONGO_URI = "mongo_uri";
constexpr const char *ST_MONGO_DATABASE = "mongo_database";

// Web Server Settings
constexpr const char *WS_ENABLED = "enabled";
constexpr const char *WS_HOST = "host";
constexpr const char *WS_PORT = "port";
constexpr const char *WS_SUBSCRIBER_QUEUE_CAPACITY =
    "subscriber_queue_capacity";
constexpr const char *WS_HEARTBEAT_SECONDS = "heartbeat_seconds";
constexpr const char *WS_MAX_PAGE_SIZE = "max_page_size";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

} // namespace Keys

struct IngestionConfig {
  size_t queue_capacity = 10000;
  size_t parse_workers = 4;
  size_t shard_count = 8;
  size_t shard_queue_capacity = 10000;
  uint64_t live_poll_interval_ms = 500;
  size_t max_line_length = 16384;
  uint64_t sweep_interval_events = 10000;
};

struct FormatSpec {
  std::string name;
  bool strict = true;
  std::string pattern;
};

struct FormatsConfig {
  std::vector<std::string> priority = {"json", "extended", "combined",
                                       "common"};
  // Formats declared in the config file, by name. A name shadows a built-in.
  std::map<std::string, FormatSpec> custom_formats;
  // Overrides for the keys a JSON line may use for a record field
  std::map<std::string, std::vector<std::string>> json_field_keys;
};

struct BehaviorConfig {
  uint64_t auth_window_seconds = 300;
  size_t auth_failure_threshold = 10;
  size_t bruteforce_max_distinct_endpoints = 3;

  uint64_t rate_window_seconds = 60;
  size_t request_rate_threshold = 300;
  size_t endpoint_rate_threshold = 1000;
  double dos_auth_failure_share = 0.5;

  uint64_t transfer_window_seconds = 3600;
  uint64_t bytes_threshold = 10ULL * 1024 * 1024;
  uint64_t outlier_min_bytes = 1024 * 1024;
  double outlier_stddev_multiplier = 6.0;
  size_t baseline_min_samples = 30;
  double baseline_alpha = 0.05;

  // 0 means ten times the longest window
  uint64_t eviction_ttl_seconds = 0;
  size_t max_events_per_window = 100000;
  size_t max_tracked_endpoints = 64;
  size_t max_endpoint_pairs_per_ip = 256;

  double confidence_floor = 0.7;
  double saturation_ratio = 1.5;

  uint64_t longest_window_ms() const;
  uint64_t effective_eviction_ttl_ms() const;
};

struct SignatureRuleSpec {
  std::string id;
  std::string attack_type;
  double confidence = 0.0;
  bool match_raw = false;
  std::string pattern;
};

struct SignatureConfig {
  bool enabled = true;
  int max_decode_passes = 2;
  std::vector<std::string> disabled_rules;
  std::vector<SignatureRuleSpec> custom_rules;
};

struct AlertingConfig {
  uint64_t coalescing_interval_seconds = 60;
  size_t max_source_records_per_alert = 32;
  size_t corroboration_min_triggers = 3;
  double corroboration_bonus = 0.05;
  size_t coalescing_stripes = 16;
};

struct MetricsConfig {
  size_t unique_clients_exact_cap = 1024;
  size_t top_k_capacity = 128;
  size_t max_user_agent_length = 200;
};

struct EnrichmentConfig {
  std::string geo_cidr_file;
  std::string geo_http_endpoint;
  uint64_t geo_http_timeout_ms = 250;
  size_t geo_cache_size = 10000;
  // Consecutive failed lookups before the service is left alone
  size_t geo_failure_threshold = 5;
  uint64_t geo_cooldown_ms = 30000;
  std::vector<std::string> bot_ua_substrings = {
      "bot",        "crawler",     "spider",         "scraper",
      "curl",       "wget",        "python-requests", "java/",
      "go-http-client", "node-fetch", "apache-httpclient", "okhttp",
      "libwww-perl", "sqlmap",     "nikto",          "nmap",
      "masscan",    "zgrab",       "nuclei"};
};

struct StorageConfig {
  std::string backend = "memory";
  std::string mongo_uri = "mongodb://localhost:27017";
  std::string mongo_database = "log_sentinel";
};

struct WebServerConfig {
  bool enabled = false;
  std::string host = "0.0.0.0";
  int port = 8080;
  size_t subscriber_queue_capacity = 1024;
  uint64_t heartbeat_seconds = 15;
  size_t max_page_size = 1000;
};

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct AppConfig {
  std::vector<std::string> batch_input_paths;
  std::string live_input_path;

  IngestionConfig ingestion;
  FormatsConfig formats;
  BehaviorConfig behavior;
  SignatureConfig signatures;
  AlertingConfig alerting;
  MetricsConfig metrics;
  EnrichmentConfig enrichment;
  StorageConfig storage;
  WebServerConfig web_server;
  LoggingConfig logging;

  std::map<std::string, std::string> custom_settings;
};

bool validate_ingestion_config(const IngestionConfig &config,
                               std::vector<std::string> &errors);
bool validate_formats_config(const FormatsConfig &config,
                             std::vector<std::string> &errors);
bool validate_behavior_config(const BehaviorConfig &config,
                              std::vector<std::string> &errors);
bool validate_signature_config(const SignatureConfig &config,
                               std::vector<std::string> &errors);
bool validate_alerting_config(const AlertingConfig &config,
                              std::vector<std::string> &errors);
bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors);
bool validate_enrichment_config(const EnrichmentConfig &config,
                                std::vector<std::string> &errors);
bool validate_storage_config(const StorageConfig &config,
                             std::vector<std::string> &errors);
bool validate_web_server_config(const WebServerConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills `config` from an INI file. Returns false if the file can't be read.
// Values that do not parse are appended to `errors` and leave the field
// unchanged.
bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;

  // Parses and validates; on failure the current configuration is kept
  bool load_configuration(const std::string &filepath);

  // Same as load_configuration but throws ClassifierConfigError carrying
  // every validation message. Used where an invalid file must be fatal.
  void load_configuration_or_throw(const std::string &filepath);

  bool reload();

  std::shared_ptr<const AppConfig> get_config() const;
  std::string get_config_path() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
