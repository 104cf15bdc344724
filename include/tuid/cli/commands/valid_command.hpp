#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tuid/cli/application.hpp"

namespace tuid::cli {

class ValidCommand : public Command {
public:
  ValidCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "valid"; }
  std::string description() const override { return "Check identifiers fall between 2000 and 2100"; }
  void setupCommand(CLI::App* cmd) override;

private:
  std::vector<std::string> ids_;
};

} // namespace tuid::cli
