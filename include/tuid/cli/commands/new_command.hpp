#pragma once

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

#include "tuid/cli/application.hpp"

namespace tuid::cli {

/**
 * Generate new identifiers
 *
 * Without --at the current time is used for each identifier. --entropy
 * rebuilds one exact identifier and therefore requires --at.
 */
class NewCommand : public Command {
public:
  explicit NewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new"; }
  std::string description() const override { return "Generate new identifiers"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  int count_ = 1;
  std::string at_;
  std::uint32_t entropy_ = 0;
  bool first_ = false;

  CLI::Option* count_option_ = nullptr;
  CLI::Option* entropy_option_ = nullptr;
};

} // namespace tuid::cli
