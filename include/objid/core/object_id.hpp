#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "objid/common.hpp"
#include "objid/util/time.hpp"

namespace objid::core {

class ObjectId;

// Dynamically-typed input accepted by ObjectId::from and ObjectId::isValid.
// std::monostate stands for "no value".
using Candidate = std::variant<std::monostate, ObjectId, Bytes, std::string,
                               std::int64_t, double, bool>;

// Single-step check handed to an external validation framework
using Validator = std::function<Result<ObjectId>(const Candidate&)>;

// 12-byte identifier, sortable by creation time:
//   [0:4]  seconds since the Unix epoch, signed big-endian
//   [4:7]  machine identifier (FNV-1a 24 of the host name)
//   [7:9]  process id mod 65536, big-endian
//   [9:12] process-wide counter, big-endian, wraps mod 2^24
class ObjectId {
 public:
  static constexpr std::size_t kSize = 12;
  static constexpr std::size_t kHexLength = kSize * 2;

  using Raw = std::array<std::uint8_t, kSize>;

  // New identifier from the process-default generator
  static ObjectId generate();

  // Any 12 bytes, accepted verbatim
  static ObjectId fromRaw(const Raw& raw) noexcept;

  // Exactly 12 bytes, otherwise kInvalidId
  static Result<ObjectId> fromBytes(std::span<const std::uint8_t> bytes);

  // Exactly 24 hex digits (either case), otherwise kInvalidId
  static Result<ObjectId> fromHex(std::string_view hex);

  // ObjectId copies, Bytes go through fromBytes, strings through fromHex.
  // Every other alternative fails with kTypeError.
  static Result<ObjectId> from(const Candidate& candidate);

  // Dummy identifier carrying only a generation time, for range queries.
  // The 8 bytes after the timestamp are zero, so the result must never be
  // stored as a real record identifier. Naive times are taken as UTC.
  static ObjectId fromDatetime(const util::CalendarTime& generation_time);
  static ObjectId fromDatetime(std::chrono::system_clock::time_point utc_time);

  // True iff from(candidate) would succeed. Empty candidates are never valid.
  static bool isValid(const Candidate& candidate);

  // Accepts only a candidate that already holds an ObjectId; no parsing.
  static Result<ObjectId> validate(const Candidate& candidate);

  // Validators for external validation frameworks
  static std::vector<Validator> validators();

  const Raw& raw() const noexcept { return raw_; }

  // 24 lowercase hex characters
  std::string toHex() const;

  // ObjectId('<hex>')
  std::string toDebugString() const;

  // Signed seconds stored in the first 4 bytes
  std::int32_t timestamp() const noexcept;

  // Generation time in UTC, precise to the second
  std::chrono::sys_seconds generationTime() const noexcept;

  std::array<std::uint8_t, 3> machineBytes() const noexcept;
  std::uint16_t processId() const noexcept;
  std::uint32_t counter() const noexcept;

  // Comparison operators, byte-wise over raw()
  bool operator==(const ObjectId& other) const noexcept;
  bool operator!=(const ObjectId& other) const noexcept;
  bool operator<(const ObjectId& other) const noexcept;
  bool operator<=(const ObjectId& other) const noexcept;
  bool operator>(const ObjectId& other) const noexcept;
  bool operator>=(const ObjectId& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const ObjectId& id) const noexcept;
  };

 private:
  explicit ObjectId(const Raw& raw) noexcept : raw_(raw) {}

  Raw raw_;
};

std::ostream& operator<<(std::ostream& os, const ObjectId& id);

}  // namespace objid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<objid::core::ObjectId> : objid::core::ObjectId::Hash {};
}  // namespace std
