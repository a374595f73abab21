#include "test_helpers.hpp"

#include <random>

#include "objid/core/identity_source.hpp"

namespace objid::test {

objid::Bytes bytesOf(std::string_view text) {
  return objid::Bytes(text.begin(), text.end());
}

objid::Bytes randomBytes(size_t length) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dis(0, 255);

  objid::Bytes result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result.push_back(static_cast<std::uint8_t>(dis(gen)));
  }
  return result;
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

std::unique_ptr<objid::core::ObjectIdGenerator> makeFixedGenerator(
    const std::string& hostname, std::uint32_t pid, std::uint32_t counter_seed,
    std::chrono::system_clock::time_point now) {
  objid::core::FixedIdentitySource identity(hostname, pid);
  return std::make_unique<objid::core::ObjectIdGenerator>(
      identity, counter_seed, [now] { return now; });
}

}  // namespace objid::test
