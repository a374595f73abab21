#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "objid/common.hpp"

namespace objid::util {

// Lowercase hex encoding, two digits per byte
std::string toHex(std::span<const std::uint8_t> bytes);

// Decode hex digits (either case) into bytes.
// Fails with kParseError on odd length or a non-hex digit.
Result<Bytes> fromHex(std::string_view hex);

// Value of a single hex digit, -1 if not a hex digit
int hexDigitValue(char c) noexcept;

}  // namespace objid::util
