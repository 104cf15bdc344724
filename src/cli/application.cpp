#include "tuid/cli/application.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tuid/util/logging.hpp"

// Command includes
#include "tuid/cli/commands/compare_command.hpp"
#include "tuid/cli/commands/config_command.hpp"
#include "tuid/cli/commands/duration_command.hpp"
#include "tuid/cli/commands/info_command.hpp"
#include "tuid/cli/commands/new_command.hpp"
#include "tuid/cli/commands/valid_command.hpp"

namespace tuid::cli {

Application::Application()
    : app_("tuid", "Time-based unique identifier tool")
    , services_initialized_(false) {

  // Set up the application
  app_.set_version_flag("--version", tuid::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (-vv for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  // Generation
  registerCommand(std::make_unique<NewCommand>(*this));

  // Inspection
  registerCommand(std::make_unique<InfoCommand>());
  registerCommand(std::make_unique<ValidCommand>());
  registerCommand(std::make_unique<DurationCommand>());
  registerCommand(std::make_unique<CompareCommand>());

  // Configuration management
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  tuid new -n 5
  tuid new --at 2021-03-08T05:54:09.208207Z --first
  tuid info 91Mq07yx9IxHCi5Y --json
  tuid valid 91Mq07yx9IxHCi5Y 5Hr02eJHAfTt1tTM
  tuid duration 9AxgffrWr9qCnfIT 9AxjEL0lPtoGAbLE
  tuid config set generate.count 3

For more information on a specific command, run:
  tuid <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    // Initialize services before running command
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    spdlog::debug("Running command '{}'", cmd_ptr->name());
    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("Command '{}' failed: {}", cmd_ptr->name(), result.error().message());
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  // An explicit --config must load; the default file is optional
  std::string config_warning;
  if (!global_options_.config_file.empty()) {
    auto loaded = config_.load(global_options_.config_file);
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  } else {
    auto default_path = config::Config::defaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(default_path, ec)) {
      auto loaded = config_.load(default_path);
      if (!loaded.has_value()) {
        config_warning = loaded.error().message();
        config_ = config::Config{};
      }
    }
  }

  // A loaded configuration has already been validated
  auto level = util::parseLogLevel(config_.log_level).value_or(spdlog::level::warn);
  if (global_options_.verbose >= 2) {
    level = std::min(level, spdlog::level::trace);
  } else if (global_options_.verbose == 1) {
    level = std::min(level, spdlog::level::debug);
  }
  if (global_options_.quiet) {
    level = std::max(level, spdlog::level::err);
  }

  util::setupLogging(level, config_.log_to_file ? util::defaultLogFile()
                                                : std::filesystem::path{});

  if (!config_warning.empty()) {
    spdlog::warn("Ignoring configuration file: {}", config_warning);
  }
  spdlog::debug("Configuration: {}",
                config_.path().empty() ? std::string("defaults") : config_.path().string());

  // Either --json or the configuration enables JSON output
  global_options_.json = global_options_.json || config_.json;

  services_initialized_ = true;
  return {};
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    std::cout << output.dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

tuid::config::Config& Application::config() {
  return config_;
}

} // namespace tuid::cli
