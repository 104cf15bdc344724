#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tuid/cli/application.hpp"

namespace tuid::cli {

class DurationCommand : public Command {
public:
  DurationCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "duration"; }
  std::string description() const override { return "Time elapsed between two identifiers"; }
  void setupCommand(CLI::App* cmd) override;

private:
  std::string start_;
  std::string stop_;
};

} // namespace tuid::cli
