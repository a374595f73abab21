#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace objid::core {

// FNV-1a 32-bit parameters
// http://isthe.com/chongo/tech/comp/fnv/index.html#FNV-1a
constexpr std::uint32_t kFnv32OffsetBasis = 2166136261u;
constexpr std::uint32_t kFnv32Prime = 16777619u;

// 32-bit FNV-1a folded to 24 bits: (h >> 24) ^ (h & 0xFFFFFF)
std::uint32_t fnv1a24(std::span<const std::uint8_t> data) noexcept;
std::uint32_t fnv1a24(std::string_view data) noexcept;

}  // namespace objid::core
