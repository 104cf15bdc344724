#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tuid/cli/application.hpp"

namespace tuid::cli {

class InfoCommand : public Command {
public:
  InfoCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "info"; }
  std::string description() const override { return "Show timestamp and entropy of identifiers"; }
  void setupCommand(CLI::App* cmd) override;

private:
  std::vector<std::string> ids_;
};

} // namespace tuid::cli
