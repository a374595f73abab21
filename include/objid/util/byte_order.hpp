#pragma once

#include <cstdint>

namespace objid::util {

inline void storeBigEndian32(std::uint32_t value, std::uint8_t* out) noexcept {
  out[0] = static_cast<std::uint8_t>(value >> 24);
  out[1] = static_cast<std::uint8_t>(value >> 16);
  out[2] = static_cast<std::uint8_t>(value >> 8);
  out[3] = static_cast<std::uint8_t>(value);
}

inline void storeBigEndian16(std::uint16_t value, std::uint8_t* out) noexcept {
  out[0] = static_cast<std::uint8_t>(value >> 8);
  out[1] = static_cast<std::uint8_t>(value);
}

// Low 3 bytes of the big-endian 32-bit representation
inline void storeBigEndian24(std::uint32_t value, std::uint8_t* out) noexcept {
  out[0] = static_cast<std::uint8_t>(value >> 16);
  out[1] = static_cast<std::uint8_t>(value >> 8);
  out[2] = static_cast<std::uint8_t>(value);
}

inline void storeLittleEndian32(std::uint32_t value, std::uint8_t* out) noexcept {
  out[0] = static_cast<std::uint8_t>(value);
  out[1] = static_cast<std::uint8_t>(value >> 8);
  out[2] = static_cast<std::uint8_t>(value >> 16);
  out[3] = static_cast<std::uint8_t>(value >> 24);
}

inline std::uint32_t loadBigEndian32(const std::uint8_t* in) noexcept {
  return (static_cast<std::uint32_t>(in[0]) << 24) |
         (static_cast<std::uint32_t>(in[1]) << 16) |
         (static_cast<std::uint32_t>(in[2]) << 8) |
         static_cast<std::uint32_t>(in[3]);
}

inline std::uint32_t loadBigEndian24(const std::uint8_t* in) noexcept {
  return (static_cast<std::uint32_t>(in[0]) << 16) |
         (static_cast<std::uint32_t>(in[1]) << 8) |
         static_cast<std::uint32_t>(in[2]);
}

inline std::uint16_t loadBigEndian16(const std::uint8_t* in) noexcept {
  return static_cast<std::uint16_t>((in[0] << 8) | in[1]);
}

}  // namespace objid::util
