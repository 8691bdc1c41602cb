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

  // IO sub-components
  IO_READER,
  IO_STORE,
  IO_LIVE,
  IO_WEB,

  // Record processing stages
  PARSER,
  ENRICHMENT,
  SIGNATURE,
  BEHAVIOR,
  ALERTING,
  METRICS,

  // Ingestion orchestration
  PIPELINE,
  INTEGRITY
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

  std::mutex &output_mutex() { return output_mutex_; }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex mutex_;
  std::mutex output_mutex_;
};

// --- The Core Logging Macro ---
// The message expression is only evaluated when `should_log` passes.
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
      std::lock_guard<std::mutex> log_lock(                                    \
          LogManager::instance().output_mutex());                              \
      std::cout << oss.str() << std::endl;                                     \
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
  case LogComponent::IO_READER:
    return "IO.READER";
  case LogComponent::IO_STORE:
    return "IO.STORE";
  case LogComponent::IO_LIVE:
    return "IO.LIVE";
  case LogComponent::IO_WEB:
    return "IO.WEB";
  case LogComponent::PARSER:
    return "PARSER";
  case LogComponent::ENRICHMENT:
    return "ENRICHMENT";
  case LogComponent::SIGNATURE:
    return "DETECT.SIGNATURE";
  case LogComponent::BEHAVIOR:
    return "DETECT.BEHAVIOR";
  case LogComponent::ALERTING:
    return "ALERTING";
  case LogComponent::METRICS:
    return "METRICS";
  case LogComponent::PIPELINE:
    return "PIPELINE";
  case LogComponent::INTEGRITY:
    return "INTEGRITY";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
