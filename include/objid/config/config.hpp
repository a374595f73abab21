#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "objid/common.hpp"
#include "objid/core/generator.hpp"
#include "objid/util/logging.hpp"

namespace objid::config {

// Configuration for an application embedding objid
class Config {
 public:
  Config() = default;

  // Load from a TOML file or TOML text
  static Result<Config> fromFile(const std::filesystem::path& config_path);
  static Result<Config> fromString(std::string_view toml_text);

  // Logging configuration
  util::LoggingConfig logging;

  // Identity overrides, replacing the OS host name and pid when set
  struct IdentityConfig {
    std::optional<std::string> hostname;
    std::optional<std::uint32_t> pid;

    bool overridden() const { return hostname.has_value() || pid.has_value(); }
  };
  IdentityConfig identity;

  // Fixed initial counter value (0 .. 2^24-1), random when unset
  std::optional<std::uint32_t> counter_seed;

  // Load configuration from file, on top of current values
  Result<void> load(const std::filesystem::path& config_path);

  // Load configuration from TOML text, on top of current values
  Result<void> loadString(std::string_view toml_text);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path) const;

  // Validate configuration
  Result<void> validate() const;

  // Generator honoring the identity and counter settings
  std::unique_ptr<core::ObjectIdGenerator> makeGenerator() const;

  // Initialize logging and install makeGenerator() as the process default
  Result<void> applyToProcess() const;

 private:
  std::filesystem::path config_path_;
};

}  // namespace objid::config
