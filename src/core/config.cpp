#include "core/config.hpp"
#include "utils/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Config {

namespace {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"cli", LogComponent::CLI},
    {"plugin.registry", LogComponent::PLUGIN_REGISTRY},
    {"plugin.selector", LogComponent::PLUGIN_SELECTOR},
    {"plugin.supervisor", LogComponent::PLUGIN_SUPERVISOR},
    {"plugin.algorithm", LogComponent::PLUGIN_ALGORITHM},
    {"cancel", LogComponent::CANCEL},
    {"resources", LogComponent::RESOURCES},
    {"engine.compress", LogComponent::ENGINE_COMPRESS},
    {"engine.decompress", LogComponent::ENGINE_DECOMPRESS},
    {"engine.inspect", LogComponent::ENGINE_INSPECT},
    {"format", LogComponent::FORMAT}};

bool is_wildcard_key(const std::string &key) {
  return key.length() > 2 && key.substr(key.length() - 2) == ".*";
}

bool is_known_component_key(const std::string &key) {
  if (key_to_component_map.count(key))
    return true;
  if (!is_wildcard_key(key))
    return false;
  std::string prefix = key.substr(0, key.length() - 1);
  for (const auto &pair : key_to_component_map)
    if (pair.first.rfind(prefix, 0) == 0)
      return true;
  return false;
}

std::string format_double(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

const char *bool_to_string(bool value) { return value ? "true" : "false"; }

// Strict boolean parse used for user-provided settings.
std::optional<bool> parse_bool(const std::string &raw) {
  std::string val = Utils::to_lower_copy(Utils::trim_copy(raw));
  if (val == "true" || val == "1" || val == "yes" || val == "on")
    return true;
  if (val == "false" || val == "0" || val == "no" || val == "off")
    return false;
  return std::nullopt;
}

struct SettingRef {
  const char *section;
  const char *key;
};

// Every scalar setting in save/list order. Per-component logging keys are
// handled separately.
const std::vector<SettingRef> scalar_settings = {
    {Keys::SECTION_COMPRESSION, Keys::DEFAULT_PLUGIN},
    {Keys::SECTION_COMPRESSION, Keys::LEVEL},
    {Keys::SECTION_COMPRESSION, Keys::THROUGHPUT_WEIGHT},
    {Keys::SECTION_COMPRESSION, Keys::RATIO_WEIGHT},
    {Keys::SECTION_COMPRESSION, Keys::TIMEOUT_SECONDS},
    {Keys::SECTION_COMPRESSION, Keys::PRESERVE_METADATA},
    {Keys::SECTION_OUTPUT, Keys::OUT_QUIET},
    {Keys::SECTION_OUTPUT, Keys::OUT_CANCEL_HINT},
    {Keys::SECTION_OUTPUT, Keys::OUT_JSON},
    {Keys::SECTION_LOGGING, Keys::LOGGING_DEFAULT_LEVEL},
    {Keys::SECTION_LOGGING, Keys::LOGGING_FILE}};

std::optional<std::string> get_setting(const AppConfig &config,
                                       const std::string &section,
                                       const std::string &key) {
  if (section == Keys::SECTION_COMPRESSION) {
    const auto &c = config.compression;
    if (key == Keys::DEFAULT_PLUGIN)
      return c.default_plugin;
    if (key == Keys::LEVEL)
      return c.level;
    if (key == Keys::THROUGHPUT_WEIGHT)
      return c.throughput_weight ? format_double(*c.throughput_weight) : "";
    if (key == Keys::RATIO_WEIGHT)
      return c.ratio_weight ? format_double(*c.ratio_weight) : "";
    if (key == Keys::TIMEOUT_SECONDS)
      return std::to_string(c.timeout_seconds);
    if (key == Keys::PRESERVE_METADATA)
      return bool_to_string(c.preserve_metadata);
  } else if (section == Keys::SECTION_OUTPUT) {
    const auto &o = config.output;
    if (key == Keys::OUT_QUIET)
      return bool_to_string(o.quiet);
    if (key == Keys::OUT_CANCEL_HINT)
      return bool_to_string(o.cancel_hint);
    if (key == Keys::OUT_JSON)
      return bool_to_string(o.json);
  } else if (section == Keys::SECTION_LOGGING) {
    const auto &l = config.logging;
    if (key == Keys::LOGGING_DEFAULT_LEVEL)
      return l.default_level;
    if (key == Keys::LOGGING_FILE)
      return l.file;
    auto it = l.component_levels.find(key);
    if (it != l.component_levels.end())
      return it->second;
  }
  return std::nullopt;
}

// "compression.level" -> ("Compression", "level")
std::optional<std::pair<std::string, std::string>>
split_dotted_key(const std::string &dotted_key) {
  size_t dot = dotted_key.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= dotted_key.size())
    return std::nullopt;

  std::string section = Utils::to_lower_copy(dotted_key.substr(0, dot));
  std::string key = dotted_key.substr(dot + 1);
  for (const char *known : {Keys::SECTION_COMPRESSION, Keys::SECTION_OUTPUT,
                            Keys::SECTION_LOGGING}) {
    if (Utils::to_lower_copy(known) == section)
      return std::make_pair(std::string(known), key);
  }
  return std::nullopt;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::to_lower_copy(Utils::trim_copy(level_str_raw));
  if (level_str == "trace")
    return LogLevel::TRACE;
  if (level_str == "debug")
    return LogLevel::DEBUG;
  if (level_str == "info")
    return LogLevel::INFO;
  if (level_str == "warn" || level_str == "warning")
    return LogLevel::WARN;
  if (level_str == "error")
    return LogLevel::ERROR;
  if (level_str == "fatal")
    return LogLevel::FATAL;
  return std::nullopt;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  return parse_log_level(level_str_raw).value_or(LogLevel::INFO);
}

std::optional<std::pair<double, double>>
level_weights(const std::string &level) {
  std::string l = Utils::to_lower_copy(Utils::trim_copy(level));
  if (l == "fast")
    return std::make_pair(0.9, 0.1);
  if (l == "balanced")
    return std::make_pair(0.5, 0.5);
  if (l == "best")
    return std::make_pair(0.1, 0.9);
  if (l == "default")
    return std::make_pair(0.7, 0.3);
  return std::nullopt;
}

std::pair<double, double> CompressionConfig::resolved_weights() const {
  auto weights = level_weights(level).value_or(std::make_pair(0.7, 0.3));
  if (throughput_weight)
    weights.first = *throughput_weight;
  if (ratio_weight)
    weights.second = *ratio_weight;
  return weights;
}

std::map<LogComponent, LogLevel>
resolve_log_levels(const LoggingConfig &config) {
  std::map<LogComponent, LogLevel> levels;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    levels[pair.second] = LogLevel::WARN;
  // Except for the user facing components
  levels[LogComponent::CORE] = LogLevel::INFO;
  levels[LogComponent::CLI] = LogLevel::INFO;

  if (auto level = parse_log_level(config.default_level)) {
    for (auto &pair : levels)
      pair.second = *level;
  }

  // Wildcards first so an exact key always wins, e.g. "plugin.* = debug"
  // together with "plugin.registry = error".
  for (const auto &entry : config.component_levels) {
    if (!is_wildcard_key(entry.first))
      continue;
    auto level = parse_log_level(entry.second);
    if (!level)
      continue;
    std::string prefix = entry.first.substr(0, entry.first.length() - 1);
    for (const auto &pair : key_to_component_map) {
      if (pair.first.rfind(prefix, 0) == 0)
        levels[pair.second] = *level;
    }
  }

  for (const auto &entry : config.component_levels) {
    auto comp_it = key_to_component_map.find(entry.first);
    if (comp_it == key_to_component_map.end())
      continue;
    if (auto level = parse_log_level(entry.second))
      levels[comp_it->second] = *level;
  }
  return levels;
}

bool apply_setting(AppConfig &config, const std::string &section,
                   const std::string &key, const std::string &value,
                   std::string &error) {
  auto bad_value = [&](const char *expected) {
    error = "Invalid value '" + value + "' for " + section + "." + key +
            " (expected " + expected + ")";
    return false;
  };

  // Compression Settings
  if (section == Keys::SECTION_COMPRESSION) {
    auto &c = config.compression;
    if (key == Keys::DEFAULT_PLUGIN) {
      if (value.empty())
        return bad_value("an algorithm name or 'auto'");
      c.default_plugin = value;
    } else if (key == Keys::LEVEL) {
      if (!level_weights(value))
        return bad_value("fast, balanced, best or default");
      c.level = Utils::to_lower_copy(value);
    } else if (key == Keys::THROUGHPUT_WEIGHT || key == Keys::RATIO_WEIGHT) {
      auto &target =
          key == Keys::THROUGHPUT_WEIGHT ? c.throughput_weight : c.ratio_weight;
      if (value.empty()) {
        target.reset();
        return true;
      }
      auto weight = Utils::string_to_number<double>(value);
      if (!weight)
        return bad_value("a number");
      target = *weight;
    } else if (key == Keys::TIMEOUT_SECONDS) {
      auto seconds = Utils::string_to_number<uint64_t>(value);
      if (!seconds)
        return bad_value("a non-negative integer");
      c.timeout_seconds = *seconds;
    } else if (key == Keys::PRESERVE_METADATA) {
      auto flag = parse_bool(value);
      if (!flag)
        return bad_value("a boolean");
      c.preserve_metadata = *flag;
    } else {
      error = "Unknown key '" + key + "' in [" + section + "]";
      return false;
    }
    return true;
  }

  // Output Settings
  if (section == Keys::SECTION_OUTPUT) {
    auto flag = parse_bool(value);
    bool *target = nullptr;
    if (key == Keys::OUT_QUIET)
      target = &config.output.quiet;
    else if (key == Keys::OUT_CANCEL_HINT)
      target = &config.output.cancel_hint;
    else if (key == Keys::OUT_JSON)
      target = &config.output.json;
    else {
      error = "Unknown key '" + key + "' in [" + section + "]";
      return false;
    }
    if (!flag)
      return bad_value("a boolean");
    *target = *flag;
    return true;
  }

  // Logging Settings
  if (section == Keys::SECTION_LOGGING) {
    auto &l = config.logging;
    if (key == Keys::LOGGING_FILE) {
      l.file = value;
      return true;
    }
    if (!value.empty() && !parse_log_level(value))
      return bad_value("trace, debug, info, warn, error or fatal");

    std::string lowered = Utils::to_lower_copy(key);
    if (key == Keys::LOGGING_DEFAULT_LEVEL) {
      l.default_level = Utils::to_lower_copy(value);
    } else if (is_known_component_key(lowered)) {
      if (value.empty())
        l.component_levels.erase(lowered);
      else
        l.component_levels[lowered] = Utils::to_lower_copy(value);
    } else {
      error = "Unknown logging component '" + key + "'";
      return false;
    }
    return true;
  }

  error = "Unknown section [" + section + "]";
  return false;
}

bool apply_dotted_setting(AppConfig &config, const std::string &dotted_key,
                          const std::string &value, std::string &error) {
  auto parts = split_dotted_key(dotted_key);
  if (!parts) {
    error = "Invalid key '" + dotted_key +
            "' (expected section.key, e.g. compression.level)";
    return false;
  }
  return apply_setting(config, parts->first, parts->second, value, error);
}

std::optional<std::string> get_dotted_setting(const AppConfig &config,
                                              const std::string &dotted_key) {
  auto parts = split_dotted_key(dotted_key);
  if (!parts)
    return std::nullopt;
  return get_setting(config, parts->first,
                     parts->first == Keys::SECTION_LOGGING
                         ? Utils::to_lower_copy(parts->second)
                         : parts->second);
}

std::vector<std::pair<std::string, std::string>>
list_settings(const AppConfig &config) {
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto &setting : scalar_settings) {
    auto value = get_setting(config, setting.section, setting.key);
    out.emplace_back(Utils::to_lower_copy(setting.section) + "." + setting.key,
                     value.value_or(""));
  }
  for (const auto &entry : config.logging.component_levels)
    out.emplace_back("logging." + entry.first, entry.second);
  return out;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
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

    std::string error;
    if (!apply_setting(config, current_section, key, value, error)) {
      std::cerr << "Warning (Config Line " << line_num << "): " << error
                << std::endl;
    }
  }

  return true;
}

void apply_env_overrides(AppConfig &config, std::vector<std::string> &errors) {
  auto env_name = [](const std::string &section, const std::string &key) {
    std::string name = std::string(ENV_PREFIX) + section + "_" + key;
    for (auto &ch : name) {
      ch = (ch == '.' || ch == '*') ? '_' : static_cast<char>(std::toupper(
                                                static_cast<unsigned char>(ch)));
    }
    return name;
  };

  for (const auto &setting : scalar_settings) {
    std::string name = env_name(setting.section, setting.key);
    const char *raw = std::getenv(name.c_str());
    if (raw == nullptr)
      continue;

    std::string error;
    if (!apply_setting(config, setting.section, setting.key,
                       Utils::trim_copy(raw), error))
      errors.push_back(name + ": " + error);
  }

  for (const auto &pair : key_to_component_map) {
    std::string name = env_name(Keys::SECTION_LOGGING, pair.first);
    const char *raw = std::getenv(name.c_str());
    if (raw == nullptr)
      continue;

    std::string error;
    if (!apply_setting(config, Keys::SECTION_LOGGING, pair.first,
                       Utils::trim_copy(raw), error))
      errors.push_back(name + ": " + error);
  }
}

bool validate_compression_config(const CompressionConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (!level_weights(config.level)) {
    errors.push_back("Unknown compression level: " + config.level);
    valid = false;
  }

  auto weights = config.resolved_weights();
  if (weights.first < 0.0 || weights.second < 0.0) {
    errors.push_back("Scoring weights must be non-negative");
    valid = false;
  } else if (weights.first == 0.0 && weights.second == 0.0) {
    errors.push_back("At least one scoring weight must be greater than zero");
    valid = false;
  }

  if (config.timeout_seconds > MAX_TIMEOUT_SECONDS) {
    errors.push_back("timeout_seconds must not exceed " +
                     std::to_string(MAX_TIMEOUT_SECONDS));
    valid = false;
  }

  if (config.default_plugin.empty()) {
    errors.push_back("default_plugin must not be empty");
    valid = false;
  }

  return valid;
}

bool validate_logging_config(const LoggingConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (!config.default_level.empty() && !parse_log_level(config.default_level)) {
    errors.push_back("Unknown log level: " + config.default_level);
    valid = false;
  }

  for (const auto &entry : config.component_levels) {
    if (!parse_log_level(entry.second)) {
      errors.push_back("Unknown log level for " + entry.first + ": " +
                       entry.second);
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_compression_config(config.compression, errors))
    valid = false;

  if (!validate_logging_config(config.logging, errors))
    valid = false;

  return valid;
}

bool save_configuration(const AppConfig &config, const std::string &filepath) {
  std::error_code ec;
  auto parent = std::filesystem::path(filepath).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  std::ofstream out(filepath, std::ios::trunc);
  if (!out.is_open()) {
    std::cerr << "Error: could not write configuration to '" << filepath
              << "'" << std::endl;
    return false;
  }

  std::string current_section;
  for (const auto &setting : scalar_settings) {
    if (current_section != setting.section) {
      if (!current_section.empty())
        out << "\n";
      current_section = setting.section;
      out << "[" << current_section << "]\n";
    }
    auto value = get_setting(config, setting.section, setting.key);
    out << setting.key << " = " << value.value_or("") << "\n";
  }
  for (const auto &entry : config.logging.component_levels)
    out << entry.first << " = " << entry.second << "\n";

  out.flush();
  return static_cast<bool>(out);
}

std::string default_config_path() {
  if (const char *explicit_path = std::getenv(CONFIG_FILE_ENV)) {
    if (*explicit_path != '\0')
      return explicit_path;
  }
  if (const char *home = std::getenv("HOME")) {
    if (*home != '\0')
      return (std::filesystem::path(home) / ".config" / "crush" / "crush.ini")
          .string();
  }
  return "crush.ini";
}

bool ConfigManager::load_configuration(const std::string &filepath,
                                       bool allow_missing, bool apply_env) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    if (!allow_missing) {
      std::cerr << "Failed to read configuration file: " << filepath
                << ". Keeping existing settings." << std::endl;
      return false;
    }
    *new_config = AppConfig{};
  }

  std::vector<std::string> validation_errors;
  if (apply_env)
    apply_env_overrides(*new_config, validation_errors);

  // Validate the configuration
  if (!validate_app_config(*new_config, validation_errors) ||
      !validation_errors.empty()) {
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
  return true;
}

bool ConfigManager::set_value(const std::string &dotted_key,
                              const std::string &value,
                              std::vector<std::string> &errors) {
  auto new_config = std::make_shared<AppConfig>(*get_config());

  std::string error;
  if (!apply_dotted_setting(*new_config, dotted_key, value, error)) {
    errors.push_back(error);
    return false;
  }
  if (!validate_app_config(*new_config, errors))
    return false;

  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  return true;
}

void ConfigManager::reset_to_defaults() {
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = std::make_shared<AppConfig>();
}

bool ConfigManager::save(const std::string &filepath) const {
  return save_configuration(*get_config(), filepath);
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
