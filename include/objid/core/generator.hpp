#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "objid/common.hpp"
#include "objid/core/identity_source.hpp"
#include "objid/core/object_id.hpp"

namespace objid::core {

// Derive the 3 machine bytes from a host name: FNV-1a 24, packed
// little-endian, padding byte dropped.
std::array<std::uint8_t, 3> machineBytesFor(std::string_view hostname) noexcept;

// Owns the state shared by every identifier it generates: the cached machine
// bytes, the truncated pid and the rolling 24-bit counter. generate() and
// nextCounter() are safe to call from any thread.
class ObjectIdGenerator {
 public:
  static constexpr std::uint32_t kCounterModulus = 1u << 24;

  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // Reads the identity once. Without a seed the counter starts at a value
  // drawn uniformly from [0, 2^24). Without a clock the system clock is used.
  explicit ObjectIdGenerator(const IdentitySource& identity,
                             std::optional<std::uint32_t> counter_seed = std::nullopt,
                             Clock clock = {});

  ObjectIdGenerator(const ObjectIdGenerator&) = delete;
  ObjectIdGenerator& operator=(const ObjectIdGenerator&) = delete;

  ObjectId generate();

  // Current counter value; advances it by one mod 2^24. Wraparound is silent.
  std::uint32_t nextCounter();

  const std::array<std::uint8_t, 3>& machineBytes() const { return machine_bytes_; }
  std::uint16_t processId() const { return process_id_; }

  // Generator used by ObjectId::generate(), built from the OS identity on
  // first use unless one was installed beforehand.
  static ObjectIdGenerator& processDefault();

  // Install the process-default generator. Fails with kInvalidState once the
  // default has been created or installed.
  static Result<void> configureProcessDefault(std::unique_ptr<ObjectIdGenerator> generator);

 private:
  std::array<std::uint8_t, 3> machine_bytes_;
  std::uint16_t process_id_;
  Clock clock_;

  std::mutex counter_mutex_;
  std::uint32_t counter_;
};

}  // namespace objid::core
