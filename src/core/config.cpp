#include "config.hpp"
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
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

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
    {"rules.eval", LogComponent::RULES_EVAL},
    {"decision.engine", LogComponent::DECISION_ENGINE},
    {"decision.cache", LogComponent::DECISION_CACHE},
    {"ml.features", LogComponent::ML_FEATURES},
    {"ml.inference", LogComponent::ML_INFERENCE},
    {"ml.lifecycle", LogComponent::ML_LIFECYCLE},
    {"io.database", LogComponent::IO_DATABASE},
    {"io.fetch", LogComponent::IO_FETCH},
    {"io.web", LogComponent::IO_WEB},
    {"session.lifecycle", LogComponent::SESSION_LIFECYCLE},
    {"session.health", LogComponent::SESSION_HEALTH},
    {"session.expiry", LogComponent::SESSION_EXPIRY},
    {"session.secret", LogComponent::SESSION_SECRET},
    {"state.persist", LogComponent::STATE_PERSIST}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<std::string> string_to_list(const std::string &value) {
  std::vector<std::string> items;
  for (const auto &raw : Utils::split_string(value, ',')) {
    std::string item = Utils::trim_copy(raw);
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

void apply_default_log_levels(LoggingConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    config.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE and the session lifecycle, which report INFO by default
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
  config.log_levels[LogComponent::SESSION_LIFECYCLE] = LogLevel::INFO;
}

bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.decision_threshold < 0.0 || config.decision_threshold > 1.0) {
    errors.push_back("Classifier decision threshold must be between 0.0 and "
                     "1.0");
    valid = false;
  }

  if (config.enabled && config.model_path.empty()) {
    errors.push_back("Classifier model path must not be empty when the "
                     "classifier is enabled");
    valid = false;
  }

  return valid;
}

bool validate_metadata_fetch_config(const MetadataFetchConfig &config,
                                    std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_count < 1 || config.worker_count > 64) {
    errors.push_back("Metadata fetch worker count must be between 1 and 64");
    valid = false;
  }

  if (config.wait_timeout_ms == 0) {
    errors.push_back("Metadata fetch wait timeout must be greater than 0");
    valid = false;
  }

  // The caller-facing bound must undercut the fetch's own timeout
  if (static_cast<uint64_t>(config.wait_timeout_ms) >=
      static_cast<uint64_t>(config.request_timeout_seconds) * 1000) {
    errors.push_back("Metadata fetch wait timeout must be shorter than the "
                     "request timeout");
    valid = false;
  }

  if (config.max_pending == 0) {
    errors.push_back("Metadata fetch max pending must be greater than 0");
    valid = false;
  }

  return valid;
}

bool validate_session_config(const SessionConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (Utils::trim_copy(config.enforcement_command).empty()) {
    errors.push_back("Session enforcement command must not be empty");
    valid = false;
  }

  if (config.proxy_port < 1 || config.proxy_port > 65535) {
    errors.push_back("Session proxy port must be between 1 and 65535");
    valid = false;
  }

  if (config.health_check_interval_ms == 0 ||
      config.expiry_check_interval_ms == 0) {
    errors.push_back("Session check intervals must be greater than 0");
    valid = false;
  }

  if (config.terminate_timeout_ms == 0) {
    errors.push_back("Session terminate timeout must be greater than 0");
    valid = false;
  }

  if (config.max_restart_attempts < 1) {
    errors.push_back("Session max restart attempts must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_classifier_config(config.classifier, errors);
  valid &= validate_metadata_fetch_config(config.metadata_fetch, errors);
  valid &= validate_session_config(config.session, errors);

  if (config.cache.ttl_seconds == 0) {
    errors.push_back("Cache TTL must be greater than 0");
    valid = false;
  }

  if (config.statistics.flush_every_feedback == 0) {
    errors.push_back("Statistics flush interval must be greater than 0");
    valid = false;
  }

  if (config.decision_store.backend != "memory" &&
      config.decision_store.backend != "mongodb") {
    errors.push_back("Decision store backend must be 'memory' or 'mongodb'");
    valid = false;
  }

  if (config.decision_store.memory_capacity == 0) {
    errors.push_back("Decision store memory capacity must be greater than 0");
    valid = false;
  }

  if (config.web_server.port < 1 || config.web_server.port > 65535) {
    errors.push_back("Web server port must be between 1 and 65535");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
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

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::STATE_DIR)
          config.state_dir = value;
        else if (key == Keys::MISSION_PATH)
          config.mission_path = value;
        else if (key == Keys::SESSION_RECORD_PATH)
          config.session_record_path = value;
        else if (key == Keys::STATS_SNAPSHOT_PATH)
          config.stats_snapshot_path = value;
        else
          config.custom_settings[key] = value;

      } else if (current_section == "RuleTier") {
        if (key == Keys::RT_ENABLED)
          config.rule_tier.enabled = string_to_bool(value);
        else if (key == Keys::RT_EXTRA_EDUCATIONAL_DOMAINS)
          config.rule_tier.extra_educational_domains = string_to_list(value);
        else if (key == Keys::RT_EXTRA_BLOCKED_DOMAINS)
          config.rule_tier.extra_blocked_domains = string_to_list(value);

      } else if (current_section == "Classifier") {
        if (key == Keys::CL_ENABLED)
          config.classifier.enabled = string_to_bool(value);
        else if (key == Keys::CL_MODEL_PATH)
          config.classifier.model_path = value;
        else if (key == Keys::CL_DECISION_THRESHOLD)
          config.classifier.decision_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.classifier.decision_threshold);
        else if (key == Keys::CL_UNTRAINED_SEED)
          config.classifier.untrained_seed =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.classifier.untrained_seed);

      } else if (current_section == "Cache") {
        if (key == Keys::CA_TTL_SECONDS)
          config.cache.ttl_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.cache.ttl_seconds);

      } else if (current_section == "DecisionStore") {
        if (key == Keys::DS_BACKEND)
          config.decision_store.backend = value;
        else if (key == Keys::DS_MONGO_URI)
          config.decision_store.mongo_uri = value;
        else if (key == Keys::DS_MONGO_DATABASE)
          config.decision_store.mongo_database = value;
        else if (key == Keys::DS_MONGO_COLLECTION)
          config.decision_store.mongo_collection = value;
        else if (key == Keys::DS_MEMORY_CAPACITY)
          config.decision_store.memory_capacity =
              Utils::string_to_number<size_t>(value).value_or(
                  config.decision_store.memory_capacity);

      } else if (current_section == "Statistics") {
        if (key == Keys::ST_FLUSH_EVERY_FEEDBACK)
          config.statistics.flush_every_feedback =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.statistics.flush_every_feedback);

      } else if (current_section == "MetadataFetch") {
        if (key == Keys::MF_ENABLED)
          config.metadata_fetch.enabled = string_to_bool(value);
        else if (key == Keys::MF_WORKER_COUNT)
          config.metadata_fetch.worker_count =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.metadata_fetch.worker_count);
        else if (key == Keys::MF_WAIT_TIMEOUT_MS)
          config.metadata_fetch.wait_timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.metadata_fetch.wait_timeout_ms);
        else if (key == Keys::MF_REQUEST_TIMEOUT_SECONDS)
          config.metadata_fetch.request_timeout_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.metadata_fetch.request_timeout_seconds);
        else if (key == Keys::MF_MAX_PENDING)
          config.metadata_fetch.max_pending =
              Utils::string_to_number<size_t>(value).value_or(
                  config.metadata_fetch.max_pending);
        else if (key == Keys::MF_MAX_CONTENT_BYTES)
          config.metadata_fetch.max_content_bytes =
              Utils::string_to_number<size_t>(value).value_or(
                  config.metadata_fetch.max_content_bytes);
        else if (key == Keys::MF_USER_AGENT)
          config.metadata_fetch.user_agent = value;

      } else if (current_section == "Session") {
        if (key == Keys::SE_ENFORCEMENT_COMMAND)
          config.session.enforcement_command = value;
        else if (key == Keys::SE_ENFORCEMENT_ARGS)
          config.session.enforcement_args = string_to_list(value);
        else if (key == Keys::SE_PROXY_PORT)
          config.session.proxy_port =
              Utils::string_to_number<int>(value).value_or(
                  config.session.proxy_port);
        else if (key == Keys::SE_STARTUP_GRACE_MS)
          config.session.startup_grace_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.session.startup_grace_ms);
        else if (key == Keys::SE_TERMINATE_TIMEOUT_MS)
          config.session.terminate_timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.session.terminate_timeout_ms);
        else if (key == Keys::SE_HEALTH_CHECK_INTERVAL_MS)
          config.session.health_check_interval_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.session.health_check_interval_ms);
        else if (key == Keys::SE_EXPIRY_CHECK_INTERVAL_MS)
          config.session.expiry_check_interval_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.session.expiry_check_interval_ms);
        else if (key == Keys::SE_MAX_RESTART_ATTEMPTS)
          config.session.max_restart_attempts =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.session.max_restart_attempts);

      } else if (current_section == "WebServer") {
        if (key == Keys::WS_ENABLED)
          config.web_server.enabled = string_to_bool(value);
        else if (key == Keys::WS_HOST)
          config.web_server.host = value;
        else if (key == Keys::WS_PORT)
          config.web_server.port = Utils::string_to_number<int>(value).value_or(
              config.web_server.port);

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
            // Wildcard match, e.g., "session.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          } else {
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
          }
        }
      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section '" << current_section << "'"
                  << std::endl;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

ConfigManager::ConfigManager() {
  auto defaults = std::make_shared<AppConfig>();
  apply_default_log_levels(defaults->logging);
  current_config_ = defaults;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
