#include "tuid/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tuid::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  // Require exactly one subcommand
  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options);
  } else if (set_mode_) {
    return executeSet(options);
  } else if (list_mode_) {
    return executeList(options);
  } else if (path_mode_) {
    return executePath(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(makeError(save_result.error().code(),
                                     "Failed to save configuration: " +
                                         save_result.error().message()));
  }
  spdlog::info("Set {} = {}", key_, value_);

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  const auto& config = app_.config();
  nlohmann::json output = nlohmann::json::object();

  for (const auto& key : config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (options.json) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << "\n";
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  const auto& config = app_.config();
  auto path = config.path().empty() ? config::Config::defaultConfigPath() : config.path();

  if (options.json) {
    nlohmann::json output;
    output["path"] = path.string();
    output["exists"] = std::filesystem::exists(path);
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << path.string() << "\n";
  }
  return 0;
}

}  // namespace tuid::cli
