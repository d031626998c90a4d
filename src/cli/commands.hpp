#ifndef CRUSH_COMMANDS_HPP
#define CRUSH_COMMANDS_HPP

#include "cancel/cancellation_token.hpp"
#include "cli/args.hpp"
#include "core/config.hpp"
#include "plugin/registry.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace crush::cli {

// Inputs larger than this get the "Press Ctrl+C to cancel" hint.
constexpr uint64_t CANCEL_HINT_THRESHOLD = 1024 * 1024;

constexpr const char *COMPRESSED_EXTENSION = ".crush";

struct CliContext {
  Config::ConfigManager &config_manager;
  // Where `config set/reset` write to
  std::string config_path;
  std::shared_ptr<CancellationToken> cancellation;
  const PluginRegistry &registry;
  std::istream &in;
  std::ostream &out;
  std::ostream &err;
};

// Runs one parsed command and returns the process exit code. Errors are
// reported on ctx.err; nothing is thrown.
int run_command(const ParsedArgs &args, CliContext &ctx);

// 130 (3 on Windows) for cancellation, 1 for everything else.
int exit_code_for(const std::exception &e);

// FILE -> FILE.crush
std::filesystem::path default_compress_output(const std::filesystem::path &input);
// FILE.crush -> FILE, anything else -> FILE.out
std::filesystem::path
default_decompress_output(const std::filesystem::path &input);

} // namespace crush::cli

#endif // CRUSH_COMMANDS_HPP
