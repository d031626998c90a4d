#ifndef CRUSH_ARGS_HPP
#define CRUSH_ARGS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace crush::cli {

constexpr const char *VERSION = "0.4.0";

// Process exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE = 2;
#ifdef _WIN32
constexpr int EXIT_CANCELLED = 3;
#else
// 128 + SIGINT
constexpr int EXIT_CANCELLED = 130;
#endif

enum class Command {
  Help,
  Version,
  Compress,
  Decompress,
  Inspect,
  PluginsList,
  PluginsInfo,
  PluginsTest,
  ConfigGet,
  ConfigSet,
  ConfigList,
  ConfigReset
};

// Report format for inspect and plugins list/info.
enum class OutputFormat { Text, Json, Csv };

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &message)
      : std::runtime_error(message) {}
};

struct ParsedArgs {
  // Global flags
  int verbosity = 0;
  bool quiet = false;
  std::optional<std::string> config_file;

  Command command = Command::Help;

  // compress / decompress / inspect
  std::vector<std::string> inputs;
  std::optional<std::string> output;
  bool to_stdout = false;
  bool force = false;
  // compress -p, and the NAME of plugins info/test
  std::optional<std::string> plugin;
  std::optional<std::string> level;
  std::optional<uint64_t> timeout_seconds;

  // inspect / plugins; unset means the configured default
  std::optional<OutputFormat> format;
  bool summary = false;

  // config
  std::string key;
  std::string value;

  bool modifies_config() const {
    return command == Command::ConfigSet || command == Command::ConfigReset;
  }
};

// `args` excludes the program name. Throws UsageError.
ParsedArgs parse_args(const std::vector<std::string> &args);

std::string usage_text();

} // namespace crush::cli

#endif // CRUSH_ARGS_HPP
