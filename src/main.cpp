#include "cancel/cancellation_token.hpp"
#include "cli/args.hpp"
#include "cli/commands.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "plugin/registry.hpp"
#include "plugin/selector.hpp"

#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

using namespace crush;

// Token shared with the running command. The handler only touches the raw
// pointer: shared_ptr operations are not async-signal-safe.
std::shared_ptr<CancellationToken> g_cancel_token;
CancellationToken *g_signal_token = nullptr;

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
void write_notice(const char *message, size_t len) {
  // Nothing useful can be done if stderr is gone
  ssize_t ignored = write(STDERR_FILENO, message, len);
  (void)ignored;
}

void signal_handler(int signum) {
  if ((signum != SIGINT && signum != SIGTERM) || g_signal_token == nullptr)
    return;

  if (g_signal_token->cancel() == CancelRequest::Accepted) {
    static const char msg[] = "\nCancelling operation...\n";
    write_notice(msg, sizeof(msg) - 1);
  } else {
    static const char msg[] = "\nAlready cancelling, please wait...\n";
    write_notice(msg, sizeof(msg) - 1);
  }
}

void install_signal_handlers() {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
}
#else
void signal_handler(int signum) {
  if (g_signal_token == nullptr)
    return;
  if (g_signal_token->cancel() == CancelRequest::Accepted)
    std::cerr << "\nCancelling operation..." << std::endl;
  else
    std::cerr << "\nAlready cancelling, please wait..." << std::endl;
  std::signal(signum, signal_handler);
}

void install_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}
#endif

namespace {

constexpr LogComponent ALL_COMPONENTS[] = {
    LogComponent::CORE,
    LogComponent::CONFIG,
    LogComponent::CLI,
    LogComponent::PLUGIN_REGISTRY,
    LogComponent::PLUGIN_SELECTOR,
    LogComponent::PLUGIN_SUPERVISOR,
    LogComponent::PLUGIN_ALGORITHM,
    LogComponent::CANCEL,
    LogComponent::RESOURCES,
    LogComponent::ENGINE_COMPRESS,
    LogComponent::ENGINE_DECOMPRESS,
    LogComponent::ENGINE_INSPECT,
    LogComponent::FORMAT};

bool configure_logging(const Config::AppConfig &config,
                       const cli::ParsedArgs &args) {
  auto &log_manager = LogManager::instance();
  log_manager.configure(Config::resolve_log_levels(config.logging));

  // Command-line verbosity wins over the file
  if (args.quiet) {
    for (auto component : ALL_COMPONENTS)
      log_manager.set_level(component, LogLevel::ERROR);
  } else if (args.verbosity > 0) {
    LogLevel level = args.verbosity == 1   ? LogLevel::INFO
                     : args.verbosity == 2 ? LogLevel::DEBUG
                                           : LogLevel::TRACE;
    for (auto component : ALL_COMPONENTS)
      log_manager.set_level(component, level);
  }

  if (!log_manager.set_log_file(config.logging.file)) {
    std::cerr << "crush: cannot open log file " << config.logging.file
              << std::endl;
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  std::cin.tie(nullptr);

  cli::ParsedArgs args;
  try {
    args = cli::parse_args(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const cli::UsageError &e) {
    std::cerr << "crush: " << e.what() << "\n\n" << cli::usage_text();
    return cli::EXIT_USAGE;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  const bool explicit_config = args.config_file.has_value();
  const std::string config_path =
      explicit_config ? *args.config_file : Config::default_config_path();

  // set/reset may create the file; reset must also work on a broken one
  const bool allow_missing = !explicit_config || args.modifies_config();
  if (!config_manager.load_configuration(config_path, allow_missing,
                                         !args.modifies_config()) &&
      args.command != cli::Command::ConfigReset)
    return cli::EXIT_USAGE;
  auto config = config_manager.get_config();

  if (!configure_logging(*config, args))
    return cli::EXIT_USAGE;

  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Using configuration " << config_path);

  try {
    auto [throughput, ratio] = config->compression.resolved_weights();
    set_default_weights(ScoringWeights::create(throughput, ratio));
  } catch (const CrushError &e) {
    std::cerr << "crush: " << e.what() << std::endl;
    return cli::EXIT_USAGE;
  }

  init_plugins();

  g_cancel_token = std::make_shared<CancellationToken>();
  g_signal_token = g_cancel_token.get();
  install_signal_handlers();

  cli::CliContext ctx{config_manager,   config_path, g_cancel_token,
                      global_registry(), std::cin,    std::cout,
                      std::cerr};
  const int exit_code = cli::run_command(args, ctx);

  std::cout.flush();
  LOG(LogLevel::DEBUG, LogComponent::CORE, "Exiting with code " << exit_code);
  return exit_code;
}
