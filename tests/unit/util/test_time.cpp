#include <gtest/gtest.h>

#include <chrono>

#include "objid/core/object_id.hpp"
#include "objid/util/time.hpp"
#include "test_helpers.hpp"

using namespace objid::util;
using objid::ErrorCode;

namespace {

std::chrono::sys_seconds jan2010() {
  return std::chrono::sys_days{std::chrono::year{2010} / 1 / 1};
}

}  // namespace

TEST(TimeTest, FormatRfc3339) {
  EXPECT_EQ(Time::toRfc3339(jan2010()), "2010-01-01T00:00:00Z");
  EXPECT_EQ(Time::toRfc3339(jan2010() + std::chrono::hours(13) + std::chrono::minutes(5) +
                            std::chrono::seconds(9)),
            "2010-01-01T13:05:09Z");
  EXPECT_EQ(Time::toRfc3339(std::chrono::sys_seconds{std::chrono::seconds{-1}}),
            "1969-12-31T23:59:59Z");
}

TEST(TimeTest, ParseUtc) {
  auto result = Time::fromRfc3339("2010-01-01T00:00:00Z");

  ASSERT_OK(result);
  EXPECT_TRUE(result->isAware());
  EXPECT_EQ(Time::toUtc(*result), jan2010());
}

TEST(TimeTest, ParseNaive) {
  auto result = Time::fromRfc3339("2010-01-01T00:00:00");

  ASSERT_OK(result);
  EXPECT_FALSE(result->isAware());
  EXPECT_EQ(Time::toUtc(*result), jan2010());
}

TEST(TimeTest, ParseOffset) {
  auto east = Time::fromRfc3339("2010-01-01T05:30:00+05:30");
  auto west = Time::fromRfc3339("2009-12-31T19:00:00-05:00");

  ASSERT_OK(east);
  ASSERT_OK(west);
  EXPECT_EQ(east->utc_offset, std::chrono::minutes(330));
  EXPECT_EQ(west->utc_offset, std::chrono::minutes(-300));
  EXPECT_EQ(Time::toUtc(*east), jan2010());
  EXPECT_EQ(Time::toUtc(*west), jan2010());
}

TEST(TimeTest, ParseFraction) {
  auto result = Time::fromRfc3339("2010-01-01T00:00:00.250Z");

  ASSERT_OK(result);
  EXPECT_EQ(Time::toUtc(*result), jan2010() + std::chrono::milliseconds(250));
}

TEST(TimeTest, ParseErrors) {
  EXPECT_ERROR(Time::fromRfc3339("yesterday"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2010-13-01T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2010-02-30T00:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2010-01-01T24:00:00Z"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromRfc3339("2010-01-01T00:00:00+25:00"), ErrorCode::kParseError);
}

TEST(TimeTest, GenerationTimeMatchesParsedInput) {
  auto parsed = Time::fromRfc3339("2021-06-15T08:45:30.900+02:00");
  ASSERT_OK(parsed);

  auto id = objid::core::ObjectId::fromDatetime(*parsed);

  EXPECT_EQ(Time::toRfc3339(id.generationTime()), "2021-06-15T06:45:30Z");
}
