#include "tuid/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tuid/util/xdg.hpp"

namespace tuid::util {

namespace {

constexpr const char* kLoggerName = "tuid";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr std::size_t kMaxLogFiles = 3;

}  // namespace

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;

  return makeErrorResult<spdlog::level::level_enum>(ErrorCode::kConfigError,
                                                    "Unknown log level: " + name);
}

void setupLogging(spdlog::level::level_enum level, const std::filesystem::path& log_file) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  std::string file_error;
  if (!log_file.empty()) {
    try {
      std::filesystem::create_directories(log_file.parent_path());
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file.string(), kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
      // Fall back to console-only logging
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

std::filesystem::path defaultLogFile() {
  return Xdg::dataHome() / "logs" / "tuid.log";
}

}  // namespace tuid::util
