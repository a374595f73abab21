#include "objid/config/config.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <toml++/toml.hpp>

#include "objid/core/identity_source.hpp"

namespace objid::config {

namespace {

Result<void> readTable(const toml::table& config_data, Config& config) {
  // Logging
  if (auto* logging_table = config_data["logging"].as_table()) {
    if (auto value = (*logging_table)["level"].value<std::string>()) {
      auto level = util::Logging::parseLevel(*value);
      if (!level) {
        return std::unexpected(level.error());
      }
      config.logging.level = *level;
    }
    if (auto value = (*logging_table)["file"].value<std::string>()) {
      if (value->empty()) {
        config.logging.file.reset();
      } else {
        config.logging.file = std::filesystem::path(*value);
      }
    }
    if (auto value = (*logging_table)["max_file_size"].value<std::int64_t>()) {
      if (*value <= 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "logging.max_file_size must be positive"));
      }
      config.logging.max_file_size = static_cast<std::size_t>(*value);
    }
    if (auto value = (*logging_table)["max_files"].value<std::int64_t>()) {
      if (*value < 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "logging.max_files must not be negative"));
      }
      config.logging.max_files = static_cast<std::size_t>(*value);
    }
  }

  // Identity overrides
  if (auto* identity_table = config_data["identity"].as_table()) {
    if (auto value = (*identity_table)["hostname"].value<std::string>()) {
      config.identity.hostname = *value;
    }
    if (auto value = (*identity_table)["pid"].value<std::int64_t>()) {
      if (*value < 0 || *value > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "identity.pid out of range: " + std::to_string(*value)));
      }
      config.identity.pid = static_cast<std::uint32_t>(*value);
    }
  }

  // Counter
  if (auto* counter_table = config_data["counter"].as_table()) {
    if (auto value = (*counter_table)["seed"].value<std::int64_t>()) {
      if (*value < 0 || *value >= core::ObjectIdGenerator::kCounterModulus) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "counter.seed out of range: " + std::to_string(*value)));
      }
      config.counter_seed = static_cast<std::uint32_t>(*value);
    }
  }

  return {};
}

}  // namespace

Result<Config> Config::fromFile(const std::filesystem::path& config_path) {
  Config config;
  auto result = config.load(config_path);
  if (!result) {
    return std::unexpected(result.error());
  }
  return config;
}

Result<Config> Config::fromString(std::string_view toml_text) {
  Config config;
  auto result = config.loadString(toml_text);
  if (!result) {
    return std::unexpected(result.error());
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    auto result = readTable(config_data, *this);
    if (!result) {
      util::Logging::logger()->warn("Invalid config {}: {}", config_path.string(),
                                    result.error().describe());
    }
    return result;
  } catch (const toml::parse_error& e) {
    util::Logging::logger()->warn("Failed to parse config {}: {}", config_path.string(), e.what());
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::loadString(std::string_view toml_text) {
  try {
    auto config_data = toml::parse(toml_text);
    return readTable(config_data, *this);
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;
  if (save_path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "No config path to save to"));
  }

  toml::table config_data;

  // Logging
  auto logging_table = toml::table{};
  auto level_name = spdlog::level::to_string_view(logging.level);
  logging_table.insert_or_assign("level", std::string(level_name.data(), level_name.size()));
  logging_table.insert_or_assign("file", logging.file ? logging.file->string() : std::string());
  logging_table.insert_or_assign("max_file_size", static_cast<std::int64_t>(logging.max_file_size));
  logging_table.insert_or_assign("max_files", static_cast<std::int64_t>(logging.max_files));
  config_data.insert_or_assign("logging", logging_table);

  // Identity
  if (identity.overridden()) {
    auto identity_table = toml::table{};
    if (identity.hostname) identity_table.insert_or_assign("hostname", *identity.hostname);
    if (identity.pid) identity_table.insert_or_assign("pid", static_cast<std::int64_t>(*identity.pid));
    config_data.insert_or_assign("identity", identity_table);
  }

  // Counter
  if (counter_seed) {
    auto counter_table = toml::table{};
    counter_table.insert_or_assign("seed", static_cast<std::int64_t>(*counter_seed));
    config_data.insert_or_assign("counter", counter_table);
  }

  std::error_code ec;
  if (save_path.has_parent_path()) {
    std::filesystem::create_directories(save_path.parent_path(), ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Failed to create config directory: " + ec.message()));
    }
  }

  std::ofstream file(save_path);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to open config file for writing: " + save_path.string()));
  }
  file << config_data << "\n";
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to write config file: " + save_path.string()));
  }

  return {};
}

Result<void> Config::validate() const {
  if (counter_seed && *counter_seed >= core::ObjectIdGenerator::kCounterModulus) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Counter seed out of range: " + std::to_string(*counter_seed)));
  }

  if (identity.hostname && identity.hostname->empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Hostname override is empty"));
  }

  if (logging.max_file_size == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid max_file_size value"));
  }

  return {};
}

std::unique_ptr<core::ObjectIdGenerator> Config::makeGenerator() const {
  core::SystemIdentitySource system_identity;

  if (!identity.overridden()) {
    return std::make_unique<core::ObjectIdGenerator>(system_identity, counter_seed);
  }

  std::string hostname;
  if (identity.hostname) {
    hostname = *identity.hostname;
  } else if (auto system_hostname = system_identity.hostname()) {
    hostname = *system_hostname;
  } else {
    util::Logging::logger()->warn("Host name unavailable ({}), using 'localhost'",
                                  system_hostname.error().message());
    hostname = "localhost";
  }

  core::FixedIdentitySource fixed_identity(
      std::move(hostname), identity.pid.value_or(system_identity.processId()));
  return std::make_unique<core::ObjectIdGenerator>(fixed_identity, counter_seed);
}

Result<void> Config::applyToProcess() const {
  auto valid = validate();
  if (!valid) {
    return valid;
  }

  auto logging_result = util::Logging::initialize(logging);
  if (!logging_result) {
    return logging_result;
  }

  return core::ObjectIdGenerator::configureProcessDefault(makeGenerator());
}

}  // namespace objid::config
