#include "tuid/cli/commands/compare_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tuid/core/tuid.hpp"

namespace tuid::cli {

Result<int> CompareCommand::execute(const GlobalOptions& options) {
  int result = core::compare(core::Tuid(lhs_), core::Tuid(rhs_));

  if (options.json) {
    nlohmann::json output;
    output["a"] = lhs_;
    output["b"] = rhs_;
    output["result"] = result;
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  std::cout << result << "\n";
  return 0;
}

void CompareCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("a", lhs_, "First identifier")->required();
  cmd->add_option("b", rhs_, "Second identifier")->required();
}

} // namespace tuid::cli
