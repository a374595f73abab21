#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>

#include "objid/common.hpp"
#include "objid/core/generator.hpp"
#include "objid/core/object_id.hpp"

namespace objid::test {

// Bytes of a string literal, without the terminator
objid::Bytes bytesOf(std::string_view text);

// Generate random bytes for testing
objid::Bytes randomBytes(size_t length);

// Generate random string for testing
std::string randomString(size_t length);

// Generator with a fixed host name, pid, counter seed and clock
std::unique_ptr<objid::core::ObjectIdGenerator> makeFixedGenerator(
    const std::string& hostname, std::uint32_t pid, std::uint32_t counter_seed,
    std::chrono::system_clock::time_point now);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace objid::test
