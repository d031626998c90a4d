#ifndef CRUSH_CONFIG_HPP
#define CRUSH_CONFIG_HPP

#include "core/logger.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Config {

using crush::LogComponent;
using crush::LogLevel;

namespace Keys {

// Section names
constexpr const char *SECTION_COMPRESSION = "Compression";
constexpr const char *SECTION_OUTPUT = "Output";
constexpr const char *SECTION_LOGGING = "Logging";

// Compression Settings
constexpr const char *DEFAULT_PLUGIN = "default_plugin";
constexpr const char *LEVEL = "level";
constexpr const char *THROUGHPUT_WEIGHT = "throughput_weight";
constexpr const char *RATIO_WEIGHT = "ratio_weight";
constexpr const char *TIMEOUT_SECONDS = "timeout_seconds";
constexpr const char *PRESERVE_METADATA = "preserve_metadata";

// Output Settings
constexpr const char *OUT_QUIET = "quiet";
constexpr const char *OUT_CANCEL_HINT = "cancel_hint";
constexpr const char *OUT_JSON = "json";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
constexpr const char *LOGGING_FILE = "file";

} // namespace Keys

// Environment variable holding an explicit config path
constexpr const char *CONFIG_FILE_ENV = "CRUSH_CONFIG_FILE";
// Prefix of per-key overrides: CRUSH_<SECTION>_<KEY>
constexpr const char *ENV_PREFIX = "CRUSH_";

constexpr uint64_t MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

struct CompressionConfig {
  // "auto" lets the selector decide
  std::string default_plugin = "auto";
  // fast | balanced | best | default
  std::string level = "default";
  // Explicit weights override the level preset when set
  std::optional<double> throughput_weight;
  std::optional<double> ratio_weight;
  // 0 disables the deadline
  uint64_t timeout_seconds = 30;
  bool preserve_metadata = true;

  // Level preset merged with explicit weights as (throughput, ratio).
  std::pair<double, double> resolved_weights() const;
};

struct OutputConfig {
  bool quiet = false;
  bool cancel_hint = true;
  bool json = false;
};

struct LoggingConfig {
  // Empty means "keep the per-component defaults"
  std::string default_level;
  // Empty means stderr
  std::string file;
  // Component keys as written, e.g. "plugin.registry" or "plugin.*"
  std::map<std::string, std::string> component_levels;
};

struct AppConfig {
  CompressionConfig compression;
  OutputConfig output;
  LoggingConfig logging;

  AppConfig() = default;
};

std::optional<LogLevel> parse_log_level(const std::string &level_str_raw);
LogLevel string_to_log_level(const std::string &level_str_raw);

// Weight preset for a level name, as (throughput, ratio).
std::optional<std::pair<double, double>> level_weights(const std::string &level);

// Effective per-component levels: CORE and CLI at INFO, everything else at
// WARN, then default_level, then wildcard keys, then exact component keys.
std::map<LogComponent, LogLevel> resolve_log_levels(const LoggingConfig &config);

// Applies one `key = value` from section `section`. Returns false and fills
// `error` when the key is unknown or the value does not parse.
bool apply_setting(AppConfig &config, const std::string &section,
                   const std::string &key, const std::string &value,
                   std::string &error);

// Same, with a dotted key such as "compression.level".
bool apply_dotted_setting(AppConfig &config, const std::string &dotted_key,
                          const std::string &value, std::string &error);

std::optional<std::string> get_dotted_setting(const AppConfig &config,
                                              const std::string &dotted_key);

// All settings as ("section.key", value), in file order.
std::vector<std::pair<std::string, std::string>>
list_settings(const AppConfig &config);

// Returns false if the file cannot be opened. Malformed lines are reported
// and skipped.
bool parse_config_into(const std::string &filepath, AppConfig &config);

// Applies CRUSH_<SECTION>_<KEY> variables. Invalid values are reported in
// `errors` and leave the setting untouched.
void apply_env_overrides(AppConfig &config, std::vector<std::string> &errors);

bool validate_compression_config(const CompressionConfig &config,
                                 std::vector<std::string> &errors);
bool validate_logging_config(const LoggingConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool save_configuration(const AppConfig &config, const std::string &filepath);

// $CRUSH_CONFIG_FILE, else $HOME/.config/crush/crush.ini, else "crush.ini".
std::string default_config_path();

class ConfigManager {
public:
  ConfigManager() = default;

  // Parses, applies environment overrides and validates. A missing file
  // yields the defaults (plus overrides) when `allow_missing` is set.
  // On failure the previous config is kept. `apply_env` is cleared when the
  // result is going to be written back to disk.
  bool load_configuration(const std::string &filepath,
                          bool allow_missing = false, bool apply_env = true);

  // Applies a dotted key on a copy, validates and swaps it in.
  bool set_value(const std::string &dotted_key, const std::string &value,
                 std::vector<std::string> &errors);

  void reset_to_defaults();

  bool save(const std::string &filepath) const;

  std::shared_ptr<const AppConfig> get_config() const;

  const std::string &config_filepath() const { return config_filepath_; }

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CRUSH_CONFIG_HPP
