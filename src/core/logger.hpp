#ifndef CRUSH_LOGGER_HPP
#define CRUSH_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace crush {

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,
  CLI,

  // Plugin sub-components
  PLUGIN_REGISTRY,
  PLUGIN_SELECTOR,
  PLUGIN_SUPERVISOR,
  PLUGIN_ALGORITHM,

  // Cancellation and cleanup
  CANCEL,
  RESOURCES,

  // Engine sub-components
  ENGINE_COMPRESS,
  ENGINE_DECOMPRESS,
  ENGINE_INSPECT,

  FORMAT
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  void configure(const std::map<LogComponent, LogLevel> &levels) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = levels;
  }

  void set_level(LogComponent component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_[component] = level;
  }

  // Empty path restores stderr. Returns false if the file could not be opened.
  bool set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path.empty()) {
      file_sink_.reset();
      return true;
    }
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open())
      return false;
    file_sink_ = std::move(file);
    return true;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_sink_) {
      *file_sink_ << line << '\n';
      file_sink_->flush();
    } else {
      std::cerr << line << std::endl;
    }
  }

private:
  LogManager() = default; // Private constructor for singleton

  mutable std::mutex mutex_;
  std::map<LogComponent, LogLevel> log_levels_;
  std::unique_ptr<std::ofstream> file_sink_;
};

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
  case LogComponent::CLI:
    return "CLI";
  case LogComponent::PLUGIN_REGISTRY:
    return "PLUGIN.REGISTRY";
  case LogComponent::PLUGIN_SELECTOR:
    return "PLUGIN.SELECTOR";
  case LogComponent::PLUGIN_SUPERVISOR:
    return "PLUGIN.SUPERVISOR";
  case LogComponent::PLUGIN_ALGORITHM:
    return "PLUGIN.ALGORITHM";
  case LogComponent::CANCEL:
    return "CANCEL";
  case LogComponent::RESOURCES:
    return "RESOURCES";
  case LogComponent::ENGINE_COMPRESS:
    return "ENGINE.COMPRESS";
  case LogComponent::ENGINE_DECOMPRESS:
    return "ENGINE.DECOMPRESS";
  case LogComponent::ENGINE_INSPECT:
    return "ENGINE.INSPECT";
  case LogComponent::FORMAT:
    return "FORMAT";
  }
  return "GENERAL";
}

} // namespace crush

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never even evaluated. Output goes to stderr or the configured
// log file, never stdout, since stdout may carry compressed data.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (::crush::LogManager::instance().should_log(level, component)) {        \
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
      oss << "[" << ::crush::level_to_string(level) << "] ";                   \
      oss << "[" << ::crush::component_to_string(component) << "] ";           \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      ::crush::LogManager::instance().write(oss.str());                        \
    }                                                                          \
  } while (0)

#endif // CRUSH_LOGGER_HPP
