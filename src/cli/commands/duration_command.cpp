#include "tuid/cli/commands/duration_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tuid/core/tuid.hpp"
#include "tuid/util/time.hpp"

namespace tuid::cli {

Result<int> DurationCommand::execute(const GlobalOptions& options) {
  auto elapsed = core::durationBetween(core::Tuid(start_), core::Tuid(stop_));
  if (!elapsed.has_value()) {
    return std::unexpected(elapsed.error());
  }

  auto formatted = util::Time::formatDuration(*elapsed);

  if (options.json) {
    nlohmann::json output;
    output["start"] = start_;
    output["stop"] = stop_;
    output["nanoseconds"] = elapsed->count();
    output["duration"] = formatted;
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  std::cout << formatted << "\n";
  return 0;
}

void DurationCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("start", start_, "Earlier identifier")->required();
  cmd->add_option("stop", stop_, "Later identifier")->required();
}

} // namespace tuid::cli
