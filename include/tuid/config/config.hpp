#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tuid/common.hpp"

namespace tuid::config {

// Configuration for the tuid command-line application
class Config {
 public:
  // Defaults only; call load() to read a file
  Config() = default;

  // Output: print JSON instead of text
  bool json = false;

  // Logging
  std::string log_level = "warn";
  bool log_to_file = false;

  // Upper bound for generate.count and "tuid new --count"
  static constexpr int kMaxGenerateCount = 1'000'000;

  // Generation defaults for "tuid new"
  struct GenerateConfig {
    int count = 1;        // Identifiers per invocation
    bool first = false;   // Zero-entropy identifiers
  };
  GenerateConfig generate;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation (e.g. "generate.count")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Path the configuration was loaded from (empty for defaults)
  const std::filesystem::path& path() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // All keys accepted by get() and set()
  static const std::vector<std::string>& keys();

 private:
  std::filesystem::path config_path_;

  static Result<bool> parseBool(const std::string& key, const std::string& value);
  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace tuid::config
