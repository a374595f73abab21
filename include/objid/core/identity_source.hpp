#pragma once

#include <cstdint>
#include <string>

#include "objid/common.hpp"

namespace objid::core {

// Abstract interface for the host identity that ObjectId generation embeds
class IdentitySource {
 public:
  virtual ~IdentitySource() = default;

  // Host name used to derive the 3 machine bytes
  virtual Result<std::string> hostname() const = 0;

  // Process id, truncated to 16 bits by the caller
  virtual std::uint32_t processId() const = 0;
};

// Reads the host name and pid from the operating system
class SystemIdentitySource : public IdentitySource {
 public:
  Result<std::string> hostname() const override;
  std::uint32_t processId() const override;
};

// Fixed values, for tests and configuration overrides
class FixedIdentitySource : public IdentitySource {
 public:
  FixedIdentitySource(std::string hostname, std::uint32_t process_id)
      : hostname_(std::move(hostname)), process_id_(process_id) {}

  Result<std::string> hostname() const override { return hostname_; }
  std::uint32_t processId() const override { return process_id_; }

 private:
  std::string hostname_;
  std::uint32_t process_id_;
};

}  // namespace objid::core
