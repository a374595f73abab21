#include "objid/util/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace objid::util {

namespace {

constexpr const char* kLoggerName = "objid";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

std::mutex& loggerMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger> makeLogger(std::vector<spdlog::sink_ptr> sinks,
                                           spdlog::level::level_enum level) {
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(level);
  spdlog::drop(kLoggerName);
  spdlog::register_logger(logger);
  return logger;
}

}  // namespace

Result<void> Logging::initialize(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(loggerMutex());

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  if (!config.file) {
    makeLogger(std::move(sinks), config.level)->debug("objid {} logging to stderr",
                                                      getVersion().toString());
    return {};
  }

  try {
    if (config.file->has_parent_path()) {
      std::filesystem::create_directories(config.file->parent_path());
    }
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file->string(), config.max_file_size, config.max_files);
    sinks.push_back(file_sink);
    makeLogger(std::move(sinks), config.level)->debug("objid {} logging to {}",
                                                      getVersion().toString(), config.file->string());
    return {};
  } catch (const std::exception& e) {
    // Console-only logging if file setup fails
    auto logger = makeLogger({console_sink}, config.level);
    logger->warn("Failed to setup file logging: {}", e.what());
    return makeErrorResult<void>(ErrorCode::kSystemError,
                                 "Failed to open log file " + config.file->string() + ": " + e.what());
  }
}

std::shared_ptr<spdlog::logger> Logging::logger() {
  std::lock_guard<std::mutex> lock(loggerMutex());

  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  return makeLogger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()},
                    spdlog::level::warn);
}

Result<spdlog::level::level_enum> Logging::parseLevel(const std::string& name) {
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

}  // namespace objid::util
