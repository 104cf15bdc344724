#include "tuid/cli/commands/valid_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tuid/core/tuid.hpp"

namespace tuid::cli {

Result<int> ValidCommand::execute(const GlobalOptions& options) {
  bool all_valid = true;
  nlohmann::json output = nlohmann::json::array();

  for (const auto& raw_id : ids_) {
    bool valid = core::isValid(core::Tuid(raw_id));
    all_valid = all_valid && valid;

    if (options.json) {
      output.push_back(nlohmann::json{{"id", raw_id}, {"valid", valid}});
    } else if (!options.quiet) {
      std::cout << raw_id << ": " << (valid ? "valid" : "invalid") << "\n";
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << std::endl;
  }

  return all_valid ? 0 : 1;
}

void ValidCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ids", ids_, "Identifiers to check")->required();
}

} // namespace tuid::cli
