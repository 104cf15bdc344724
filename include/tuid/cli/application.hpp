#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tuid/common.hpp"
#include "tuid/config/config.hpp"

namespace tuid::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options, merged with configuration defaults
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Configuration for commands, loaded before the first one runs
  tuid::config::Config& config();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeServices();
  void reportError(const Error& error) const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  tuid::config::Config config_;
  bool services_initialized_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace tuid::cli
