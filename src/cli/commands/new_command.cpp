#include "tuid/cli/commands/new_command.hpp"

#include <iostream>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tuid/core/tuid.hpp"
#include "tuid/util/time.hpp"

namespace tuid::cli {

NewCommand::NewCommand(Application& app) : app_(app) {
}

Result<int> NewCommand::execute(const GlobalOptions& options) {
  const auto& config = app_.config();

  int count = count_option_->count() > 0 ? count_ : config.generate.count;
  bool first = first_ || config.generate.first;

  std::optional<Timestamp> at;
  if (!at_.empty()) {
    auto parsed = util::Time::fromRfc3339(at_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    at = *parsed;
  }

  // An explicit entropy describes exactly one identifier
  bool explicit_entropy = entropy_option_->count() > 0;
  if (explicit_entropy) {
    count = 1;
    first = false;
  }

  if (count < 1) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Count must be at least 1"));
  }

  std::vector<core::Tuid> ids;
  ids.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    Timestamp timestamp = at.value_or(util::Time::now());
    core::Tuid id;
    if (explicit_entropy) {
      id = core::Tuid::generate(timestamp, entropy_);
    } else if (first) {
      id = core::Tuid::firstAt(timestamp);
    } else {
      id = core::Tuid::generate(timestamp);
    }

    if (id.empty()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Timestamp is before the Unix epoch: " + at_));
    }
    ids.push_back(std::move(id));
  }

  spdlog::debug("Generated {} identifier(s)", ids.size());

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& id : ids) {
      auto info = id.info();
      if (!info.has_value()) {
        return std::unexpected(info.error());
      }
      output.push_back(nlohmann::json(*info));
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  for (const auto& id : ids) {
    std::cout << id.toString() << "\n";
  }
  return 0;
}

void NewCommand::setupCommand(CLI::App* cmd) {
  count_option_ = cmd->add_option("-n,--count", count_, "Number of identifiers to generate")
                      ->check(CLI::Range(1, config::Config::kMaxGenerateCount));
  auto* at_option = cmd->add_option("--at", at_, "Use this RFC 3339 timestamp instead of now");
  auto* first_option = cmd->add_flag("--first", first_,
                                     "Zero entropy: the first identifier of the timestamp");
  entropy_option_ = cmd->add_option("--entropy", entropy_, "Explicit 32-bit entropy")
                        ->needs(at_option)
                        ->excludes(first_option);
}

} // namespace tuid::cli
