#include "objid/core/fnv.hpp"

namespace objid::core {

namespace {

template <typename It>
std::uint32_t fnv1a32(It begin, It end) noexcept {
  std::uint32_t hash = kFnv32OffsetBasis;
  for (It it = begin; it != end; ++it) {
    hash ^= static_cast<std::uint8_t>(*it);
    hash *= kFnv32Prime;  // wraps mod 2^32
  }
  return hash;
}

constexpr std::uint32_t xorFold24(std::uint32_t hash) noexcept {
  return (hash >> 24) ^ (hash & 0xFFFFFFu);
}

}  // namespace

std::uint32_t fnv1a24(std::span<const std::uint8_t> data) noexcept {
  return xorFold24(fnv1a32(data.begin(), data.end()));
}

std::uint32_t fnv1a24(std::string_view data) noexcept {
  return xorFold24(fnv1a32(data.begin(), data.end()));
}

}  // namespace objid::core
