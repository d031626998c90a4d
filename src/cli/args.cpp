#include "cli/args.hpp"
#include "utils/utils.hpp"

#include <sstream>

namespace crush::cli {

namespace {

class ArgCursor {
public:
  explicit ArgCursor(const std::vector<std::string> &args) : args_(args) {}

  bool done() const { return pos_ >= args_.size(); }
  const std::string &peek() const { return args_[pos_]; }
  const std::string &next() { return args_[pos_++]; }

  const std::string &value_for(const std::string &flag) {
    if (done())
      throw UsageError("Missing value for " + flag);
    return next();
  }

private:
  const std::vector<std::string> &args_;
  size_t pos_ = 0;
};

bool is_flag(const std::string &arg) {
  return arg.size() > 1 && arg[0] == '-';
}

void parse_transfer_args(ArgCursor &cursor, ParsedArgs &parsed) {
  const bool compressing = parsed.command == Command::Compress;
  bool only_positional = false;

  while (!cursor.done()) {
    const std::string &arg = cursor.next();
    if (only_positional || !is_flag(arg)) {
      parsed.inputs.push_back(arg);
    } else if (arg == "--") {
      only_positional = true;
    } else if (arg == "-o" || arg == "--output") {
      parsed.output = cursor.value_for(arg);
    } else if (arg == "--stdout" || arg == "-c") {
      parsed.to_stdout = true;
    } else if (arg == "-f" || arg == "--force") {
      parsed.force = true;
    } else if (compressing && (arg == "-p" || arg == "--plugin")) {
      parsed.plugin = cursor.value_for(arg);
    } else if (compressing && (arg == "-l" || arg == "--level")) {
      std::string level = Utils::to_lower_copy(cursor.value_for(arg));
      if (level != "fast" && level != "balanced" && level != "best")
        throw UsageError("Invalid level '" + level +
                         "' (expected fast, balanced or best)");
      parsed.level = level;
    } else if (compressing && arg == "--timeout") {
      const std::string &raw = cursor.value_for(arg);
      auto seconds = Utils::string_to_number<uint64_t>(raw);
      if (!seconds)
        throw UsageError("Invalid timeout '" + raw +
                         "' (expected whole seconds)");
      parsed.timeout_seconds = *seconds;
    } else {
      throw UsageError("Unknown option '" + arg + "'");
    }
  }

  if (parsed.output && parsed.to_stdout)
    throw UsageError("--output and --stdout cannot be combined");
  if (parsed.output && parsed.inputs.size() > 1)
    throw UsageError("--output can only be used with a single input file");
}

OutputFormat parse_format(const std::string &raw, bool allow_csv) {
  const std::string format = Utils::to_lower_copy(raw);
  if (format == "text" || format == "human")
    return OutputFormat::Text;
  if (format == "json")
    return OutputFormat::Json;
  if (format == "csv" && allow_csv)
    return OutputFormat::Csv;
  throw UsageError("Invalid format '" + raw + "' (expected " +
                   (allow_csv ? "text, json or csv" : "text or json") + ")");
}

// --json and --format FORMAT; returns false if `arg` is neither.
bool parse_format_flag(const std::string &arg, ArgCursor &cursor,
                       ParsedArgs &parsed, bool allow_csv) {
  if (arg == "--json") {
    parsed.format = OutputFormat::Json;
    return true;
  }
  if (arg == "--format") {
    parsed.format = parse_format(cursor.value_for(arg), allow_csv);
    return true;
  }
  return false;
}

void parse_inspect_args(ArgCursor &cursor, ParsedArgs &parsed) {
  while (!cursor.done()) {
    const std::string &arg = cursor.next();
    if (parse_format_flag(arg, cursor, parsed, true))
      continue;
    if (arg == "-s" || arg == "--summary")
      parsed.summary = true;
    else if (is_flag(arg))
      throw UsageError("Unknown option '" + arg + "'");
    else
      parsed.inputs.push_back(arg);
  }
  if (parsed.inputs.empty())
    throw UsageError("inspect requires at least one file");
  if (parsed.summary && parsed.format == OutputFormat::Csv)
    throw UsageError("--summary cannot be combined with --format csv");
}

void parse_plugins_args(ArgCursor &cursor, ParsedArgs &parsed) {
  if (cursor.done())
    throw UsageError("Expected a plugins action: list, info or test");

  const std::string action = cursor.next();
  if (action == "list") {
    parsed.command = Command::PluginsList;
  } else if (action == "info") {
    parsed.command = Command::PluginsInfo;
    parsed.plugin = cursor.value_for("plugins info");
  } else if (action == "test") {
    parsed.command = Command::PluginsTest;
    parsed.plugin = cursor.value_for("plugins test");
  } else {
    throw UsageError("Unknown plugins action '" + action + "'");
  }

  while (!cursor.done()) {
    const std::string &arg = cursor.next();
    if (parsed.command == Command::PluginsTest ||
        !parse_format_flag(arg, cursor, parsed, false))
      throw UsageError("Unexpected argument '" + arg + "'");
  }
}

void parse_config_args(ArgCursor &cursor, ParsedArgs &parsed) {
  if (cursor.done())
    throw UsageError("Expected a config action: get, set, list or reset");

  const std::string action = cursor.next();
  if (action == "get") {
    parsed.command = Command::ConfigGet;
    parsed.key = cursor.value_for("config get");
  } else if (action == "set") {
    parsed.command = Command::ConfigSet;
    parsed.key = cursor.value_for("config set");
    parsed.value = cursor.value_for("config set " + parsed.key);
  } else if (action == "list") {
    parsed.command = Command::ConfigList;
  } else if (action == "reset") {
    parsed.command = Command::ConfigReset;
  } else {
    throw UsageError("Unknown config action '" + action + "'");
  }

  if (!cursor.done())
    throw UsageError("Unexpected argument '" + cursor.peek() + "'");
}

} // namespace

ParsedArgs parse_args(const std::vector<std::string> &args) {
  ParsedArgs parsed;
  ArgCursor cursor(args);

  // Global flags come before the command
  while (!cursor.done() && is_flag(cursor.peek())) {
    const std::string &arg = cursor.next();
    if (arg == "-h" || arg == "--help") {
      parsed.command = Command::Help;
      return parsed;
    } else if (arg == "-V" || arg == "--version") {
      parsed.command = Command::Version;
      return parsed;
    } else if (arg == "-q" || arg == "--quiet") {
      parsed.quiet = true;
    } else if (arg == "--config") {
      parsed.config_file = cursor.value_for(arg);
    } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
               arg.find_first_not_of('v', 1) == std::string::npos) {
      parsed.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "--verbose") {
      parsed.verbosity += 1;
    } else {
      throw UsageError("Unknown option '" + arg + "'");
    }
  }

  if (parsed.quiet && parsed.verbosity > 0)
    throw UsageError("--quiet and --verbose cannot be combined");

  if (cursor.done())
    throw UsageError("No command given");

  const std::string command = cursor.next();
  if (command == "compress") {
    parsed.command = Command::Compress;
    parse_transfer_args(cursor, parsed);
  } else if (command == "decompress") {
    parsed.command = Command::Decompress;
    parse_transfer_args(cursor, parsed);
  } else if (command == "inspect") {
    parsed.command = Command::Inspect;
    parse_inspect_args(cursor, parsed);
  } else if (command == "plugins") {
    parse_plugins_args(cursor, parsed);
  } else if (command == "config") {
    parse_config_args(cursor, parsed);
  } else if (command == "help") {
    parsed.command = Command::Help;
  } else {
    throw UsageError("Unknown command '" + command + "'");
  }
  return parsed;
}

std::string usage_text() {
  std::ostringstream oss;
  oss << "Usage: crush [-v|-q] [--config FILE] <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  compress [FILE...]     Compress files (stdin when no FILE)\n"
      << "      -o, --output PATH  Output path (single input only)\n"
      << "      -c, --stdout       Write to stdout\n"
      << "      -p, --plugin NAME  Use a specific algorithm\n"
      << "      -l, --level LEVEL  fast | balanced | best\n"
      << "      --timeout SECS     Per-attempt deadline, 0 disables it\n"
      << "      -f, --force        Overwrite existing output\n"
      << "  decompress [FILE...]   Decompress files (stdin when no FILE)\n"
      << "      -o, --output PATH  -c, --stdout  -f, --force\n"
      << "  inspect FILE...        Show header information\n"
      << "      --format FORMAT    text | json | csv (--json for json)\n"
      << "      -s, --summary      Totals across all files\n"
      << "  plugins list [--json]  List registered algorithms\n"
      << "  plugins info NAME [--json]\n"
      << "                         Show one algorithm in detail\n"
      << "  plugins test NAME      Round-trip self-check of an algorithm\n"
      << "  config get KEY | set KEY VALUE | list | reset\n"
      << "\n"
      << "Global options:\n"
      << "  -v, -vv, -vvv          More logging on stderr\n"
      << "  -q, --quiet            Errors only\n"
      << "  --config FILE          Configuration file\n"
      << "  -h, --help             Show this help\n"
      << "  -V, --version          Show version\n"
      << "\n"
      << "Exit codes: 0 success, 1 failure, 2 usage or configuration error, "
      << EXIT_CANCELLED << " cancelled\n";
  return oss.str();
}

} // namespace crush::cli
