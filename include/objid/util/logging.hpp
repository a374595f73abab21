#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "objid/common.hpp"

namespace objid::util {

struct LoggingConfig {
  spdlog::level::level_enum level = spdlog::level::info;
  std::optional<std::filesystem::path> file;  // Rotating file sink, if set
  std::size_t max_file_size = 1024 * 1024 * 5;
  std::size_t max_files = 3;
};

// Library logger setup. Everything in objid logs through the "objid" logger.
class Logging {
 public:
  // Create (or replace) the "objid" logger with a stderr sink and an optional
  // rotating file sink. Falls back to stderr only if the file sink fails.
  static Result<void> initialize(const LoggingConfig& config);

  // The "objid" logger, created with defaults on first use
  static std::shared_ptr<spdlog::logger> logger();

  // Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
  static Result<spdlog::level::level_enum> parseLevel(const std::string& name);
};

}  // namespace objid::util
