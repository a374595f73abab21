#include "objid/util/time.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace objid::util {

std::chrono::system_clock::time_point Time::toUtc(const CalendarTime& time) {
  if (time.utc_offset) {
    return time.time - *time.utc_offset;
  }
  return time.time;
}

std::string Time::toRfc3339(std::chrono::sys_seconds time) {
  auto day = std::chrono::floor<std::chrono::days>(time);
  std::chrono::year_month_day ymd{day};
  std::chrono::hh_mm_ss hms{time - day};

  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << static_cast<int>(ymd.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
      << std::setw(2) << hms.hours().count() << ':'
      << std::setw(2) << hms.minutes().count() << ':'
      << std::setw(2) << hms.seconds().count() << 'Z';

  return oss.str();
}

Result<CalendarTime> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|z|[+-]\d{2}:\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return makeErrorResult<CalendarTime>(ErrorCode::kParseError,
                                         "Invalid RFC3339 format: " + str);
  }

  std::chrono::year_month_day ymd{
      std::chrono::year{std::stoi(match[1])},
      std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
      std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  int hour = std::stoi(match[4]);
  int minute = std::stoi(match[5]);
  int second = std::stoi(match[6]);

  if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
    return makeErrorResult<CalendarTime>(ErrorCode::kParseError,
                                         "Invalid time values: " + str);
  }

  CalendarTime result;
  result.time = std::chrono::sys_days{ymd} + std::chrono::hours(hour) +
                std::chrono::minutes(minute) + std::chrono::seconds(second);

  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(9, '0');
    result.time += std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::nanoseconds(std::stoll(fraction)));
  }

  if (match[8].matched) {
    std::string suffix = match[8].str();
    if (suffix == "Z" || suffix == "z") {
      result.utc_offset = std::chrono::minutes(0);
    } else {
      int offset_hours = std::stoi(suffix.substr(1, 2));
      int offset_minutes = std::stoi(suffix.substr(4, 2));
      if (offset_hours > 23 || offset_minutes > 59) {
        return makeErrorResult<CalendarTime>(ErrorCode::kParseError,
                                             "Invalid UTC offset: " + str);
      }
      auto offset = std::chrono::minutes(offset_hours * 60 + offset_minutes);
      result.utc_offset = suffix[0] == '-' ? -offset : offset;
    }
  }

  return result;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

}  // namespace objid::util
