#include "cli/commands.hpp"
#include "cancel/resource_tracker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "engine/stream_io.hpp"
#include "plugin/selector.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace crush::cli {

namespace {

namespace fs = std::filesystem;

constexpr const char *STDIN_NAME = "-";

struct TransferTarget {
  std::string input;
  fs::path output;
};

bool is_stdin(const std::string &input) { return input == STDIN_NAME; }

std::string display_name(const std::string &input) {
  return is_stdin(input) ? "<stdin>" : input;
}

bool effective_quiet(const ParsedArgs &args, const Config::AppConfig &config) {
  return args.quiet || config.output.quiet;
}

std::string format_mode(uint32_t mode) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%04o", mode & 07777);
  return buffer;
}

std::string format_crc(uint32_t crc) {
  char buffer[11];
  std::snprintf(buffer, sizeof(buffer), "0x%08x", crc);
  return buffer;
}

void report_error(std::ostream &err, const std::string &subject,
                  const std::exception &e) {
  err << "crush: " << subject << ": " << e.what() << "\n";

  const auto *crush_error = dynamic_cast<const CrushError *>(&e);
  if (crush_error && crush_error->header()) {
    const HeaderDiagnostics &diag = *crush_error->header();
    err << "  header: magic "
        << Utils::bytes_to_hex(diag.magic.data(), diag.magic.size())
        << ", original size " << diag.original_size;
    if (diag.has_crc32)
      err << ", crc32 " << format_crc(diag.stored_crc32);
    err << "\n";
  }
}

void maybe_print_cancel_hint(const ParsedArgs &args,
                             const Config::AppConfig &config,
                             const std::string &input, std::ostream &err) {
  if (effective_quiet(args, config) || !config.output.cancel_hint ||
      is_stdin(input))
    return;

  std::error_code ec;
  const auto size = fs::file_size(input, ec);
  if (!ec && size > CANCEL_HINT_THRESHOLD)
    err << "Press Ctrl+C to cancel\n";
}

// Same staging as CompressionEngine::compress_file, for stdin sources.
CompressionStats
stage_to_file(const fs::path &output, bool overwrite,
              const std::shared_ptr<CancellationToken> &cancellation,
              const std::function<CompressionStats(std::ostream &)> &produce) {
  std::error_code ec;
  if (fs::exists(output, ec) && !overwrite) {
    throw CrushError(ErrorKind::Io, "Output file already exists: " +
                                        output.string() +
                                        " (use --force to overwrite)");
  }

  ResourceTracker tracker;
  const auto partial = partial_path_for(output);
  std::ofstream &staged = tracker.create_temp_file(partial);

  CompressionStats stats = produce(staged);
  staged.flush();
  if (!staged)
    throw CrushError(ErrorKind::Io, "Write failed: " + partial.string());
  tracker.close_handles();

  if (cancellation)
    check_cancelled(*cancellation, "finalisation");

  fs::rename(partial, output, ec);
  if (ec) {
    throw CrushError(ErrorKind::Io, "Cannot move '" + partial.string() +
                                        "' to '" + output.string() +
                                        "': " + ec.message());
  }
  tracker.register_output(output);
  tracker.mark_complete();
  tracker.cleanup_all();
  return stats;
}

std::ifstream open_input(const std::string &input) {
  std::ifstream in(input, std::ios::binary);
  if (!in.is_open())
    throw CrushError(ErrorKind::Io, "Cannot open input file: " + input);
  return in;
}

std::vector<TransferTarget> plan_targets(const ParsedArgs &args,
                                         bool compressing) {
  std::vector<std::string> inputs = args.inputs;
  if (inputs.empty())
    inputs.push_back(STDIN_NAME);

  std::vector<TransferTarget> targets;
  for (const auto &input : inputs) {
    if (is_stdin(input) && !args.output && !args.to_stdout)
      throw UsageError("Reading from stdin requires --output or --stdout");

    TransferTarget target{input, {}};
    if (args.output)
      target.output = *args.output;
    else if (!args.to_stdout)
      target.output = compressing ? default_compress_output(input)
                                  : default_decompress_output(input);
    targets.push_back(target);
  }
  return targets;
}

std::chrono::milliseconds resolve_timeout(const ParsedArgs &args,
                                          const Config::AppConfig &config) {
  uint64_t seconds = config.compression.timeout_seconds;
  if (args.timeout_seconds) {
    if (*args.timeout_seconds > Config::MAX_TIMEOUT_SECONDS)
      throw UsageError("Timeout must be at most " +
                       std::to_string(Config::MAX_TIMEOUT_SECONDS) +
                       " seconds");
    seconds = *args.timeout_seconds;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
}

void print_compress_summary(std::ostream &out, const TransferTarget &target,
                            const CompressionStats &stats) {
  out << display_name(target.input) << " -> " << target.output.string()
      << ": " << Utils::format_bytes(stats.input_bytes) << " -> "
      << Utils::format_bytes(stats.output_bytes) << " (" << std::fixed
      << std::setprecision(1) << stats.ratio() * 100.0 << "%, "
      << stats.algorithm << ", " << std::setprecision(1)
      << stats.throughput_mbps() << " MB/s";
  if (stats.used_fallback)
    out << ", fallback";
  out << ")\n";
}

void print_decompress_summary(std::ostream &out, const TransferTarget &target,
                              const CompressionStats &stats) {
  out << display_name(target.input) << " -> " << target.output.string()
      << ": " << Utils::format_bytes(stats.output_bytes) << " restored ("
      << stats.algorithm << ", " << std::fixed << std::setprecision(1)
      << stats.throughput_mbps() << " MB/s)\n";
}

int run_compress(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const auto targets = plan_targets(args, true);

  CompressionOptions options;
  options.timeout = resolve_timeout(args, *config);
  options.cancellation = ctx.cancellation;
  if (args.plugin)
    options.algorithm_override = *args.plugin;
  else if (config->compression.default_plugin != "auto")
    options.algorithm_override = config->compression.default_plugin;
  if (args.level) {
    auto preset = Config::level_weights(*args.level);
    if (preset)
      options.weights = ScoringWeights::create(preset->first, preset->second);
  }

  FileOptions file_options;
  file_options.overwrite = args.force;
  file_options.preserve_metadata = config->compression.preserve_metadata;

  const CompressionEngine engine(ctx.registry);
  const bool quiet = effective_quiet(args, *config);
  int exit_code = EXIT_OK;

  for (const auto &target : targets) {
    maybe_print_cancel_hint(args, *config, target.input, ctx.err);
    try {
      CompressionStats stats;
      if (args.to_stdout) {
        CompressionOptions per_file = options;
        if (is_stdin(target.input)) {
          stats = engine.compress(ctx.in, ctx.out, per_file);
        } else {
          if (file_options.preserve_metadata)
            per_file.file_metadata = capture_file_metadata(target.input);
          std::ifstream in = open_input(target.input);
          stats = engine.compress(in, ctx.out, per_file);
        }
        ctx.out.flush();
      } else if (is_stdin(target.input)) {
        stats = stage_to_file(target.output, args.force, ctx.cancellation,
                              [&](std::ostream &staged) {
                                return engine.compress(ctx.in, staged,
                                                       options);
                              });
      } else {
        stats = engine.compress_file(target.input, target.output, options,
                                     file_options);
      }

      LOG(LogLevel::DEBUG, LogComponent::CLI,
          "Compressed " << display_name(target.input) << " with "
                        << stats.algorithm);
      if (!quiet && !args.to_stdout)
        print_compress_summary(ctx.out, target, stats);
    } catch (const CrushError &e) {
      if (e.is_cancellation()) {
        ctx.err << "crush: operation cancelled\n";
        return EXIT_CANCELLED;
      }
      report_error(ctx.err, display_name(target.input), e);
      // Selection errors apply to every file alike
      if (e.kind() == ErrorKind::AlgorithmNotFound ||
          e.kind() == ErrorKind::EmptyRegistry ||
          e.kind() == ErrorKind::InvalidWeights)
        return EXIT_OPERATION_FAILED;
      exit_code = EXIT_OPERATION_FAILED;
    } catch (const std::exception &e) {
      report_error(ctx.err, display_name(target.input), e);
      exit_code = EXIT_OPERATION_FAILED;
    }
  }
  return exit_code;
}

int run_decompress(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const auto targets = plan_targets(args, false);

  DecompressionOptions options;
  options.timeout = resolve_timeout(args, *config);
  options.cancellation = ctx.cancellation;

  FileOptions file_options;
  file_options.overwrite = args.force;
  file_options.preserve_metadata = config->compression.preserve_metadata;

  const CompressionEngine engine(ctx.registry);
  const bool quiet = effective_quiet(args, *config);
  int exit_code = EXIT_OK;

  for (const auto &target : targets) {
    maybe_print_cancel_hint(args, *config, target.input, ctx.err);
    try {
      CompressionStats stats;
      if (args.to_stdout) {
        if (is_stdin(target.input)) {
          stats = engine.decompress(ctx.in, ctx.out, options);
        } else {
          std::ifstream in = open_input(target.input);
          stats = engine.decompress(in, ctx.out, options);
        }
        ctx.out.flush();
      } else if (is_stdin(target.input)) {
        stats = stage_to_file(target.output, args.force, ctx.cancellation,
                              [&](std::ostream &staged) {
                                return engine.decompress(ctx.in, staged,
                                                         options);
                              });
        if (file_options.preserve_metadata && stats.file_metadata)
          restore_file_metadata(target.output, *stats.file_metadata);
      } else {
        stats = engine.decompress_file(target.input, target.output, options,
                                       file_options);
      }

      LOG(LogLevel::DEBUG, LogComponent::CLI,
          "Decompressed " << display_name(target.input) << " with "
                          << stats.algorithm);
      if (!quiet && !args.to_stdout)
        print_decompress_summary(ctx.out, target, stats);
    } catch (const CrushError &e) {
      if (e.is_cancellation()) {
        ctx.err << "crush: operation cancelled\n";
        return EXIT_CANCELLED;
      }
      report_error(ctx.err, display_name(target.input), e);
      exit_code = EXIT_OPERATION_FAILED;
    } catch (const std::exception &e) {
      report_error(ctx.err, display_name(target.input), e);
      exit_code = EXIT_OPERATION_FAILED;
    }
  }
  return exit_code;
}

void print_inspect(std::ostream &out, const std::string &file,
                   const InspectResult &result) {
  const auto &header = result.header;
  out << file << "\n"
      << "  algorithm:       " << result.algorithm << " ("
      << magic_to_string(header.magic) << ")\n"
      << "  original size:   " << header.original_size << " bytes\n"
      << "  compressed size: " << result.compressed_size << " bytes\n"
      << "  ratio:           " << std::fixed << std::setprecision(3)
      << result.ratio() << "\n"
      << "  crc32:           "
      << (header.has_crc32() ? format_crc(header.crc32) : std::string("none"))
      << "\n";

  if (result.file_metadata) {
    if (result.file_metadata->mtime)
      out << "  mtime:           " << *result.file_metadata->mtime << "\n";
    if (result.file_metadata->permissions)
      out << "  permissions:     "
          << format_mode(*result.file_metadata->permissions) << "\n";
  }
}

OutputFormat resolve_format(const ParsedArgs &args,
                           const Config::AppConfig &config) {
  if (args.format)
    return *args.format;
  return config.output.json ? OutputFormat::Json : OutputFormat::Text;
}

// RFC 4180 quoting, only where needed.
std::string csv_field(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos)
    return value;
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

using InspectedFile = std::pair<std::string, InspectResult>;

void print_inspect_csv(std::ostream &out,
                       const std::vector<InspectedFile> &inspected) {
  out << "file,algorithm,magic_number,original_size,compressed_size,ratio,"
         "crc32\n";
  for (const auto &[file, result] : inspected) {
    const auto &header = result.header;
    out << csv_field(file) << ',' << csv_field(result.algorithm) << ','
        << magic_to_string(header.magic) << ',' << header.original_size << ','
        << result.compressed_size << ',' << std::fixed << std::setprecision(4)
        << result.ratio() << ','
        << (header.has_crc32() ? format_crc(header.crc32) : std::string())
        << "\n";
  }
}

void print_inspect_summary(std::ostream &out,
                           const std::vector<InspectedFile> &inspected,
                           const InspectSummary &summary) {
  out << std::left << std::setw(32) << "FILE" << std::setw(16) << "ALGORITHM"
      << std::setw(14) << "ORIGINAL" << std::setw(14) << "COMPRESSED"
      << "RATIO\n";
  for (const auto &[file, result] : inspected) {
    out << std::left << std::setw(32) << file << std::setw(16)
        << result.algorithm << std::setw(14) << result.header.original_size
        << std::setw(14) << result.compressed_size << std::fixed
        << std::setprecision(3) << result.ratio() << "\n";
  }

  out << "\n"
      << "files:            " << summary.files << "\n"
      << "original size:    " << Utils::format_bytes(summary.original_bytes)
      << "\n"
      << "compressed size:  " << Utils::format_bytes(summary.compressed_bytes)
      << "\n"
      << "overall ratio:    " << std::fixed << std::setprecision(3)
      << summary.ratio() << "\n";
  if (summary.original_bytes > 0)
    out << "space saved:      " << std::setprecision(1)
        << (1.0 - summary.ratio()) * 100.0 << "%\n";
  if (summary.unknown_algorithms > 0)
    out << "unregistered:     " << summary.unknown_algorithms << " file(s)\n";
}

int run_inspect(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const OutputFormat format = resolve_format(args, *config);
  const CompressionEngine engine(ctx.registry);

  std::vector<InspectedFile> inspected;
  int exit_code = EXIT_OK;

  for (const auto &file : args.inputs) {
    try {
      InspectResult result = engine.inspect_file(file);
      if (!result.algorithm_known) {
        LOG(LogLevel::WARN, LogComponent::CLI,
            "'" << file << "' uses an unregistered algorithm ("
                << magic_to_string(result.header.magic) << ")");
      }
      inspected.emplace_back(file, std::move(result));
    } catch (const std::exception &e) {
      report_error(ctx.err, file, e);
      exit_code = EXIT_OPERATION_FAILED;
    }
  }

  InspectSummary summary;
  for (const auto &entry : inspected)
    summary.add(entry.second);

  switch (format) {
  case OutputFormat::Json: {
    nlohmann::json files = nlohmann::json::array();
    for (const auto &[file, result] : inspected)
      files.push_back(JsonFormatter::inspect_to_json_object(result, file));

    if (args.summary) {
      nlohmann::json report;
      report["files"] = files;
      report["summary"] = JsonFormatter::inspect_summary_to_json_object(summary);
      ctx.out << report.dump(2) << "\n";
    } else if (files.size() == 1) {
      ctx.out << files.front().dump(2) << "\n";
    } else {
      ctx.out << files.dump(2) << "\n";
    }
    break;
  }
  case OutputFormat::Csv:
    print_inspect_csv(ctx.out, inspected);
    break;
  case OutputFormat::Text:
    if (args.summary) {
      print_inspect_summary(ctx.out, inspected, summary);
    } else {
      for (const auto &[file, result] : inspected)
        print_inspect(ctx.out, file, result);
    }
    break;
  }
  return exit_code;
}

int run_plugins_list(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const bool as_json = resolve_format(args, *config) == OutputFormat::Json;

  for (const auto &warning : ctx.registry.warnings())
    ctx.err << "warning: " << warning << "\n";

  const auto plugins = ctx.registry.list();
  if (as_json) {
    ctx.out << JsonFormatter::plugins_to_json_array(plugins).dump(2) << "\n";
    return EXIT_OK;
  }

  if (plugins.empty()) {
    ctx.err << "crush: no compression algorithms registered\n";
    return EXIT_OPERATION_FAILED;
  }

  std::map<std::string, double> scores;
  for (const auto &scored : PluginSelector(ctx.registry).rank())
    scores[scored.metadata.name] = scored.score;

  const MagicNumber &default_magic = ctx.registry.default_magic();
  ctx.out << std::left << std::setw(16) << "NAME" << std::setw(10)
          << "VERSION" << std::setw(14) << "MAGIC" << std::setw(12) << "MB/S"
          << std::setw(8) << "RATIO" << std::setw(8) << "SCORE"
          << "DESCRIPTION\n";
  for (const auto &meta : plugins) {
    std::string name = meta.name;
    if (meta.magic_number == default_magic)
      name += "*";
    ctx.out << std::left << std::setw(16) << name << std::setw(10)
            << meta.version << std::setw(14)
            << magic_to_string(meta.magic_number) << std::setw(12)
            << std::fixed << std::setprecision(1) << meta.throughput_mbps
            << std::setw(8) << std::setprecision(2) << meta.compression_ratio
            << std::setw(8) << std::setprecision(3) << scores[meta.name]
            << meta.description << "\n";
  }
  ctx.out << "(* default and fallback algorithm)\n";
  return EXIT_OK;
}

// Case-insensitive lookup by name.
std::optional<AlgorithmMetadata> find_plugin(const PluginRegistry &registry,
                                             const std::string &name) {
  const std::string wanted = Utils::to_lower_copy(name);
  for (auto &meta : registry.list()) {
    if (Utils::to_lower_copy(meta.name) == wanted)
      return meta;
  }
  return std::nullopt;
}

void report_unknown_plugin(CliContext &ctx, const std::string &name) {
  ctx.err << "crush: plugin '" << name << "' not found (available:";
  for (const auto &meta : ctx.registry.list())
    ctx.err << " " << meta.name;
  ctx.err << ")\n";
}

int run_plugins_info(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const auto meta = find_plugin(ctx.registry, *args.plugin);
  if (!meta) {
    report_unknown_plugin(ctx, *args.plugin);
    return EXIT_USAGE;
  }

  double score = 0.0;
  for (const auto &scored : PluginSelector(ctx.registry).rank()) {
    if (scored.metadata.name == meta->name)
      score = scored.score;
  }
  const bool is_default = meta->magic_number == ctx.registry.default_magic();

  if (resolve_format(args, *config) == OutputFormat::Json) {
    nlohmann::json j = JsonFormatter::algorithm_to_json_object(*meta);
    j["default"] = is_default;
    j["score"] = score;
    ctx.out << j.dump(2) << "\n";
    return EXIT_OK;
  }

  ctx.out << "Plugin:        " << meta->name << "\n"
          << "Version:       " << meta->version << "\n"
          << "Magic number:  " << magic_to_string(meta->magic_number) << "\n"
          << "Default:       "
          << (is_default ? "yes (fallback target)" : "no") << "\n"
          << "Throughput:    " << std::fixed << std::setprecision(1)
          << meta->throughput_mbps << " MB/s\n"
          << "Ratio:         " << std::setprecision(2)
          << meta->compression_ratio << " (" << std::setprecision(1)
          << meta->compression_ratio * 100.0 << "% of original size)\n"
          << "Score:         " << std::setprecision(3) << score
          << " (default weights)\n"
          << "Description:   " << meta->description << "\n";
  return EXIT_OK;
}

const char *const SELF_TEST_TEXT =
    "This is test data for plugin validation. It should compress and "
    "decompress correctly. The quick brown fox jumps over the lazy dog. "
    "1234567890 ABCDEFGHIJKLMNOPQRSTUVWXYZ";

// Spans several cancellation blocks so block boundaries are exercised.
std::string multi_block_sample() {
  std::string data(3 * CANCEL_CHECK_BLOCK_SIZE + 17, '\0');
  for (size_t i = 0; i < data.size(); ++i)
    data[i] = static_cast<char>((i * 31) ^ (i >> 9));
  return data;
}

int run_plugins_test(const ParsedArgs &args, CliContext &ctx) {
  const auto config = ctx.config_manager.get_config();
  const auto meta = find_plugin(ctx.registry, *args.plugin);
  if (!meta) {
    report_unknown_plugin(ctx, *args.plugin);
    return EXIT_USAGE;
  }

  CompressionOptions compress_options;
  compress_options.algorithm_override = meta->name;
  compress_options.timeout = resolve_timeout(args, *config);
  compress_options.cancellation = ctx.cancellation;

  DecompressionOptions decompress_options;
  decompress_options.timeout = compress_options.timeout;
  decompress_options.cancellation = ctx.cancellation;

  const CompressionEngine engine(ctx.registry);
  const std::vector<std::pair<std::string, std::string>> samples = {
      {"sample text", SELF_TEST_TEXT}, {"multi-block", multi_block_sample()}};

  ctx.out << "Testing plugin '" << meta->name << "'...\n";
  bool passed = true;
  for (const auto &[label, original] : samples) {
    try {
      std::istringstream in(original, std::ios::binary);
      std::ostringstream compressed(std::ios::binary);
      CompressionStats stats = engine.compress(in, compressed, compress_options);
      if (stats.used_fallback) {
        ctx.out << "  " << label << ": FAILED (did not complete, '"
                << stats.algorithm << "' was used instead)\n";
        passed = false;
        continue;
      }

      std::istringstream back(compressed.str(), std::ios::binary);
      std::ostringstream restored(std::ios::binary);
      engine.decompress(back, restored, decompress_options);

      const bool matches = restored.str() == original;
      ctx.out << "  " << label << ": " << original.size() << " -> "
              << compressed.str().size() << " bytes, round trip "
              << (matches ? "OK" : "MISMATCH") << "\n";
      passed = passed && matches;
    } catch (const CrushError &e) {
      if (e.is_cancellation())
        throw;
      ctx.out << "  " << label << ": FAILED (" << e.what() << ")\n";
      passed = false;
    }
  }

  if (!passed) {
    ctx.err << "crush: plugin '" << meta->name << "' failed its self-test\n";
    return EXIT_OPERATION_FAILED;
  }
  ctx.out << "Plugin '" << meta->name << "' is working correctly\n";
  return EXIT_OK;
}

int save_config(CliContext &ctx) {
  if (!ctx.config_manager.save(ctx.config_path)) {
    ctx.err << "crush: cannot write configuration to " << ctx.config_path
            << "\n";
    return EXIT_OPERATION_FAILED;
  }
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration saved to " << ctx.config_path);
  return EXIT_OK;
}

int run_config(const ParsedArgs &args, CliContext &ctx) {
  switch (args.command) {
  case Command::ConfigGet: {
    auto value =
        Config::get_dotted_setting(*ctx.config_manager.get_config(), args.key);
    if (!value) {
      ctx.err << "crush: unknown setting '" << args.key << "'\n";
      return EXIT_USAGE;
    }
    ctx.out << *value << "\n";
    return EXIT_OK;
  }
  case Command::ConfigSet: {
    std::vector<std::string> errors;
    if (!ctx.config_manager.set_value(args.key, args.value, errors)) {
      for (const auto &error : errors)
        ctx.err << "crush: " << error << "\n";
      return EXIT_USAGE;
    }
    return save_config(ctx);
  }
  case Command::ConfigList:
    for (const auto &[key, value] :
         Config::list_settings(*ctx.config_manager.get_config()))
      ctx.out << key << " = " << value << "\n";
    return EXIT_OK;
  case Command::ConfigReset:
    ctx.config_manager.reset_to_defaults();
    return save_config(ctx);
  default:
    return EXIT_USAGE;
  }
}

} // namespace

fs::path default_compress_output(const fs::path &input) {
  fs::path output = input;
  output += COMPRESSED_EXTENSION;
  return output;
}

fs::path default_decompress_output(const fs::path &input) {
  if (input.extension() == COMPRESSED_EXTENSION) {
    fs::path output = input;
    output.replace_extension();
    return output;
  }
  fs::path output = input;
  output += ".out";
  return output;
}

int exit_code_for(const std::exception &e) {
  return is_cancellation(e) ? EXIT_CANCELLED : EXIT_OPERATION_FAILED;
}

int run_command(const ParsedArgs &args, CliContext &ctx) {
  try {
    switch (args.command) {
    case Command::Help:
      ctx.out << usage_text();
      return EXIT_OK;
    case Command::Version:
      ctx.out << "crush " << VERSION << "\n";
      return EXIT_OK;
    case Command::Compress:
      return run_compress(args, ctx);
    case Command::Decompress:
      return run_decompress(args, ctx);
    case Command::Inspect:
      return run_inspect(args, ctx);
    case Command::PluginsList:
      return run_plugins_list(args, ctx);
    case Command::PluginsInfo:
      return run_plugins_info(args, ctx);
    case Command::PluginsTest:
      return run_plugins_test(args, ctx);
    case Command::ConfigGet:
    case Command::ConfigSet:
    case Command::ConfigList:
    case Command::ConfigReset:
      return run_config(args, ctx);
    }
  } catch (const UsageError &e) {
    ctx.err << "crush: " << e.what() << "\n";
    return EXIT_USAGE;
  } catch (const std::exception &e) {
    if (is_cancellation(e)) {
      ctx.err << "crush: operation cancelled\n";
      return EXIT_CANCELLED;
    }
    ctx.err << "crush: " << e.what() << "\n";
    return exit_code_for(e);
  }
  return EXIT_USAGE;
}

} // namespace crush::cli
