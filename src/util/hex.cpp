#include "objid/util/hex.hpp"

namespace objid::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string toHex(std::span<const std::uint8_t> bytes) {
  std::string result;
  result.reserve(bytes.size() * 2);

  for (std::uint8_t byte : bytes) {
    result += kHexDigits[byte >> 4];
    result += kHexDigits[byte & 0x0F];
  }

  return result;
}

int hexDigitValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Result<Bytes> fromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return makeErrorResult<Bytes>(ErrorCode::kParseError,
                                  "Odd-length hex string: " + std::string(hex));
  }

  Bytes result;
  result.reserve(hex.size() / 2);

  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hexDigitValue(hex[i]);
    int low = hexDigitValue(hex[i + 1]);
    if (high < 0 || low < 0) {
      return makeErrorResult<Bytes>(ErrorCode::kParseError,
                                    "Non-hexadecimal digit found in: " + std::string(hex));
    }
    result.push_back(static_cast<std::uint8_t>((high << 4) | low));
  }

  return result;
}

}  // namespace objid::util
