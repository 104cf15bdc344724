#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tuid/cli/application.hpp"

namespace tuid::cli {

class CompareCommand : public Command {
public:
  CompareCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "compare"; }
  std::string description() const override { return "Compare two identifiers (-1, 0 or 1)"; }
  void setupCommand(CLI::App* cmd) override;

private:
  std::string lhs_;
  std::string rhs_;
};

} // namespace tuid::cli
