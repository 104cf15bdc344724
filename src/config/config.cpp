#include "tuid/config/config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "tuid/util/logging.hpp"
#include "tuid/util/xdg.hpp"

namespace tuid::config {

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  Config loaded = *this;
  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["json"].value<bool>()) {
      loaded.json = *value;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      loaded.log_level = *value;
    }
    if (auto value = config_data["log_to_file"].value<bool>()) {
      loaded.log_to_file = *value;
    }

    if (auto generate_table = config_data["generate"].as_table()) {
      if (auto value = (*generate_table)["count"].value<int64_t>()) {
        if (*value < 1 || *value > kMaxGenerateCount) {
          return std::unexpected(makeError(ErrorCode::kValidationError,
                                           "generate.count must be between 1 and " +
                                               std::to_string(kMaxGenerateCount)));
        }
        loaded.generate.count = static_cast<int>(*value);
      }
      if (auto value = (*generate_table)["first"].value<bool>()) {
        loaded.generate.first = *value;
      }
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }

  // Apply only a configuration that validates
  auto valid = loaded.validate();
  if (!valid.has_value()) {
    return valid;
  }

  loaded.config_path_ = config_path;
  *this = std::move(loaded);
  return {};
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("json", json);
  config_data.insert_or_assign("log_level", log_level);
  config_data.insert_or_assign("log_to_file", log_to_file);

  auto generate_table = toml::table{};
  generate_table.insert_or_assign("count", static_cast<int64_t>(generate.count));
  generate_table.insert_or_assign("first", generate.first);
  config_data.insert_or_assign("generate", std::move(generate_table));

  std::error_code ec;
  std::filesystem::create_directories(save_path.parent_path(), ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create config directory: " + ec.message()));
  }

  std::ofstream file(save_path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot write config file: " + save_path.string()));
  }
  file << config_data << "\n";
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed writing config file: " + save_path.string()));
  }

  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);

  if (path.size() == 1) {
    if (path[0] == "json") return json ? "true" : "false";
    if (path[0] == "log_level") return log_level;
    if (path[0] == "log_to_file") return log_to_file ? "true" : "false";
  } else if (path.size() == 2 && path[0] == "generate") {
    if (path[1] == "count") return std::to_string(generate.count);
    if (path[1] == "first") return generate.first ? "true" : "false";
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unknown configuration key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  Config updated = *this;

  if (path.size() == 1 && path[0] == "json") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.json = *parsed;
  } else if (path.size() == 1 && path[0] == "log_level") {
    updated.log_level = value;
  } else if (path.size() == 1 && path[0] == "log_to_file") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.log_to_file = *parsed;
  } else if (path.size() == 2 && path[0] == "generate" && path[1] == "count") {
    int count = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), count);
    if (ec != std::errc{} || end != value.data() + value.size()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Expected an integer for " + key + ": " + value));
    }
    updated.generate.count = count;
  } else if (path.size() == 2 && path[0] == "generate" && path[1] == "first") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.generate.first = *parsed;
  } else {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Unknown configuration key: " + key));
  }

  auto valid = updated.validate();
  if (!valid.has_value()) {
    return valid;
  }

  *this = std::move(updated);
  return {};
}

Result<void> Config::validate() const {
  auto level = util::parseLogLevel(log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  if (generate.count < 1 || generate.count > kMaxGenerateCount) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "generate.count must be between 1 and " +
                                         std::to_string(kMaxGenerateCount)));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

const std::vector<std::string>& Config::keys() {
  static const std::vector<std::string> all_keys = {
      "json", "log_level", "log_to_file", "generate.count", "generate.first"};
  return all_keys;
}

Result<bool> Config::parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;

  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Expected a boolean for " + key + ": " + value));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;
  while (std::getline(stream, part, '.')) {
    parts.push_back(part);
  }
  return parts;
}

}  // namespace tuid::config
