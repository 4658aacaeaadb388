#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // Decision sub-components
  RULES_EVAL,
  DECISION_ENGINE,
  DECISION_CACHE,

  // ML sub-components
  ML_FEATURES,
  ML_INFERENCE,
  ML_LIFECYCLE,

  // IO sub-components
  IO_DATABASE,
  IO_FETCH,
  IO_WEB,

  // Session sub-components
  SESSION_LIFECYCLE,
  SESSION_HEALTH,
  SESSION_EXPIRY,
  SESSION_SECRET,

  // State sub-components
  STATE_PERSIST
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

  // Serialises whole lines so concurrent loops do not interleave output
  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::cout << line << std::endl;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex mutex_;
  std::mutex write_mutex_;
};

// --- The Core Logging Macro ---
// A macro so that the message expression is never evaluated when
// `should_log` returns false.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm tm_utc{};                                                        \
      gmtime_r(&time_t_now, &tm_utc);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write(oss.str());                                 \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::RULES_EVAL:
    return "RULES.EVAL";
  case LogComponent::DECISION_ENGINE:
    return "DECISION.ENGINE";
  case LogComponent::DECISION_CACHE:
    return "DECISION.CACHE";
  case LogComponent::ML_FEATURES:
    return "ML.FEATURES";
  case LogComponent::ML_INFERENCE:
    return "ML.INFERENCE";
  case LogComponent::ML_LIFECYCLE:
    return "ML.LIFECYCLE";
  case LogComponent::IO_DATABASE:
    return "IO.DATABASE";
  case LogComponent::IO_FETCH:
    return "IO.FETCH";
  case LogComponent::IO_WEB:
    return "IO.WEB";
  case LogComponent::SESSION_LIFECYCLE:
    return "SESSION.LIFECYCLE";
  case LogComponent::SESSION_HEALTH:
    return "SESSION.HEALTH";
  case LogComponent::SESSION_EXPIRY:
    return "SESSION.EXPIRY";
  case LogComponent::SESSION_SECRET:
    return "SESSION.SECRET";
  case LogComponent::STATE_PERSIST:
    return "STATE.PERSIST";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
