#pragma once

#include <filesystem>
#include <string>

namespace tuid::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/tuid)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/tuid)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace tuid::util
