#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *STATE_DIR = "state_dir";
constexpr const char *MISSION_PATH = "mission_path";
constexpr const char *SESSION_RECORD_PATH = "session_record_path";
constexpr const char *STATS_SNAPSHOT_PATH = "stats_snapshot_path";

// Rule Tier Settings
constexpr const char *RT_ENABLED = "enabled";
constexpr const char *RT_EXTRA_EDUCATIONAL_DOMAINS =
    "extra_educational_domains";
constexpr const char *RT_EXTRA_BLOCKED_DOMAINS = "extra_blocked_domains";

// Classifier Settings
constexpr const char *CL_ENABLED = "enabled";
constexpr const char *CL_MODEL_PATH = "model_path";
constexpr const char *CL_DECISION_THRESHOLD = "decision_threshold";
constexpr const char *CL_UNTRAINED_SEED = "untrained_seed";

// Cache Settings
constexpr const char *CA_TTL_SECONDS = "ttl_seconds";

// Decision Store Settings
constexpr const char *DS_BACKEND = "backend";
constexpr const char *DS_MONGO_URI = "mongo_uri";
constexpr const char *DS_MONGO_DATABASE = "mongo_database";
constexpr const char *DS_MONGO_COLLECTION = "mongo_collection";
constexpr const char *DS_MEMORY_CAPACITY = "memory_capacity";

// Statistics Settings
constexpr const char *ST_FLUSH_EVERY_FEEDBACK = "flush_every_feedback";

// Metadata Fetch Settings
constexpr const char *MF_ENABLED = "enabled";
constexpr const char *MF_WORKER_COUNT = "worker_count";
constexpr const char *MF_WAIT_TIMEOUT_MS = "wait_timeout_ms";
constexpr const char *MF_REQUEST_TIMEOUT_SECONDS = "request_timeout_seconds";
constexpr const char *MF_MAX_PENDING = "max_pending";
constexpr const char *MF_MAX_CONTENT_BYTES = "max_content_bytes";
constexpr const char *MF_USER_AGENT = "user_agent";

// Session Settings
constexpr const char *SE_ENFORCEMENT_COMMAND = "enforcement_command";
constexpr const char *SE_ENFORCEMENT_ARGS = "enforcement_args";
constexpr const char *SE_PROXY_PORT = "proxy_port";
constexpr const char *SE_STARTUP_GRACE_MS = "startup_grace_ms";
constexpr const char *SE_TERMINATE_TIMEOUT_MS = "terminate_timeout_ms";
constexpr const char *SE_HEALTH_CHECK_INTERVAL_MS = "health_check_interval_ms";
constexpr const char *SE_EXPIRY_CHECK_INTERVAL_MS = "expiry_check_interval_ms";
constexpr const char *SE_MAX_RESTART_ATTEMPTS = "max_restart_attempts";

// Web Server Settings
constexpr const char *WS_ENABLED = "enabled";
constexpr const char *WS_HOST = "host";
constexpr const char *WS_PORT = "port";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct RuleTierConfig {
  bool enabled = true;
  std::vector<std::string> extra_educational_domains;
  std::vector<std::string> extra_blocked_domains;
};

struct ClassifierConfig {
  bool enabled = true;
  std::string model_path = "models/productivity_classifier.json";
  double decision_threshold = 0.5;
  uint64_t untrained_seed = 1337;
};

struct CacheConfig {
  uint64_t ttl_seconds = 300; // 5 minutes
};

struct DecisionStoreConfig {
  std::string backend = "memory";
  std::string mongo_uri = "mongodb://localhost:27017";
  std::string mongo_database = "anchorite";
  std::string mongo_collection = "decisions";
  // Decisions kept by the in-memory backend before the oldest is dropped
  size_t memory_capacity = 10000;
};

struct StatisticsConfig {
  uint64_t flush_every_feedback = 100;
};

struct MetadataFetchConfig {
  bool enabled = false;
  uint32_t worker_count = 3;
  uint32_t wait_timeout_ms = 2000;
  uint32_t request_timeout_seconds = 8;
  size_t max_pending = 32;
  size_t max_content_bytes = 500000;
  std::string user_agent =
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like "
      "Gecko) Chrome/120.0.0.0 Safari/537.36";
};

struct SessionConfig {
  std::string enforcement_command = "mitmdump";
  // "{port}" is substituted with proxy_port at spawn time
  std::vector<std::string> enforcement_args = {"--listen-port", "{port}"};
  int proxy_port = 8080;
  uint32_t startup_grace_ms = 3000;
  uint32_t terminate_timeout_ms = 10000;
  uint32_t health_check_interval_ms = 5000;
  uint32_t expiry_check_interval_ms = 60000;
  uint32_t max_restart_attempts = 10;
};

struct WebServerConfig {
  bool enabled = true;
  std::string host = "127.0.0.1";
  int port = 8765;
};

struct AppConfig {
  std::string state_dir = "data";
  std::string mission_path = "data/mission.json";
  std::string session_record_path = "data/active_session.json";
  std::string stats_snapshot_path = "data/decision_stats.json";

  RuleTierConfig rule_tier;
  ClassifierConfig classifier;
  CacheConfig cache;
  DecisionStoreConfig decision_store;
  StatisticsConfig statistics;
  MetadataFetchConfig metadata_fetch;
  SessionConfig session;
  WebServerConfig web_server;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors);
bool validate_metadata_fetch_config(const MetadataFetchConfig &config,
                                    std::vector<std::string> &errors);
bool validate_session_config(const SessionConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

// Fills every known component with the default levels (WARN, INFO for CORE
// and SESSION.LIFECYCLE)
void apply_default_log_levels(LoggingConfig &config);

class ConfigManager {
public:
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
