#include "tuid/cli/commands/info_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tuid/core/tuid.hpp"
#include "tuid/util/time.hpp"

namespace tuid::cli {

Result<int> InfoCommand::execute(const GlobalOptions& options) {
  int exit_code = 0;
  int printed = 0;
  nlohmann::json output = nlohmann::json::array();

  for (const auto& raw_id : ids_) {
    core::Tuid id(raw_id);
    auto info = id.info();
    auto value = id.toInt();

    if (!info.has_value() || !value.has_value()) {
      const auto& error = info.has_value() ? value.error() : info.error();
      spdlog::debug("Cannot decode '{}': {}", raw_id, error.message());
      exit_code = 1;
      if (options.json) {
        output.push_back(nlohmann::json{{"id", raw_id}, {"error", error.message()}});
      } else {
        std::cerr << "Error: " << raw_id << ": " << error.message() << "\n";
      }
      continue;
    }

    if (options.json) {
      output.push_back(nlohmann::json(*info));
      continue;
    }

    if (printed++ > 0) {
      std::cout << "\n";
    }
    std::cout << "id:        " << info->id.toString() << "\n"
              << "timestamp: " << util::Time::toRfc3339Nano(info->timestamp) << "\n"
              << "entropy:   " << info->entropy << "\n"
              << "integer:   " << *value << "\n";
    if (!id.isValid()) {
      std::cout << "note:      outside the 2000-2100 range\n";
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << std::endl;
  }
  return exit_code;
}

void InfoCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ids", ids_, "Identifiers to inspect")->required();
}

} // namespace tuid::cli
