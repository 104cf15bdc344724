#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "tuid/common.hpp"

namespace tuid::util {

// Map a level name (trace, debug, info, warn, error, critical, off)
Result<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Install the "tuid" logger as spdlog's default: a colour stderr sink, plus a
// rotating file sink when log_file is not empty.
void setupLogging(spdlog::level::level_enum level, const std::filesystem::path& log_file = {});

// Default rotating log location (<data home>/logs/tuid.log)
std::filesystem::path defaultLogFile();

}  // namespace tuid::util
