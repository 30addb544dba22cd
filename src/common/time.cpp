#include <agentid/common/time.hpp>

#include <array>
#include <chrono>
#include <ctime>
#include <fmt/format.h>

namespace agentid::common {

namespace {

std::optional<uint32_t> parse_digits(std::string_view value,
                                     size_t offset,
                                     size_t count) {
  if (offset + count > value.size()) {
    return std::nullopt;
  }
  auto out = uint32_t{0};
  for (size_t i = offset; i < offset + count; ++i) {
    auto c = value[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    out = (out * 10) + static_cast<uint32_t>(c - '0');
  }
  return out;
}

bool is_leap_year(uint32_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

uint32_t days_in_month(uint32_t year, uint32_t month) {
  static constexpr auto kDays =
      std::array<uint32_t, 12>{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];
}

}  // namespace

clock_fn_t system_clock() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<agentid::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

std::string format_iso8601(agentid::schema::timestamp_milliseconds_t value) {
  auto seconds = static_cast<std::time_t>(value / 1000);
  auto millis = value % 1000;
  auto parts = std::tm{};
  gmtime_r(&seconds, &parts);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                     parts.tm_hour, parts.tm_min, parts.tm_sec, millis);
}

std::optional<agentid::schema::timestamp_milliseconds_t> parse_iso8601(
    std::string_view value) {
  auto year = parse_digits(value, 0, 4);
  auto month = parse_digits(value, 5, 2);
  auto day = parse_digits(value, 8, 2);
  if (!year || !month || !day || value[4] != '-' || value[7] != '-') {
    return std::nullopt;
  }
  if (*year < 1970 || *month < 1 || *month > 12 || *day < 1 ||
      *day > days_in_month(*year, *month)) {
    return std::nullopt;
  }

  auto hour = uint32_t{0};
  auto minute = uint32_t{0};
  auto second = uint32_t{0};
  auto millis = uint32_t{0};
  auto offset_minutes = int64_t{0};
  auto position = size_t{10};

  if (position < value.size()) {
    if (value[position] != 'T' && value[position] != 't' &&
        value[position] != ' ') {
      return std::nullopt;
    }
    auto h = parse_digits(value, 11, 2);
    auto m = parse_digits(value, 14, 2);
    auto s = parse_digits(value, 17, 2);
    if (!h || !m || !s || value[13] != ':' || value[16] != ':' || *h > 23 ||
        *m > 59 || *s > 60) {
      return std::nullopt;
    }
    hour = *h;
    minute = *m;
    second = *s;
    position = 19;

    if (position < value.size() && value[position] == '.') {
      ++position;
      auto digits = size_t{0};
      while (position < value.size() && value[position] >= '0' &&
             value[position] <= '9') {
        if (digits < 3) {
          millis = (millis * 10) + static_cast<uint32_t>(value[position] - '0');
        }
        ++digits;
        ++position;
      }
      if (digits == 0) {
        return std::nullopt;
      }
      for (; digits < 3; ++digits) {
        millis *= 10;
      }
    }

    if (position >= value.size()) {
      return std::nullopt;
    }
    if (value[position] == 'Z' || value[position] == 'z') {
      ++position;
    } else if (value[position] == '+' || value[position] == '-') {
      auto sign = value[position] == '-' ? int64_t{-1} : int64_t{1};
      auto oh = parse_digits(value, position + 1, 2);
      auto om = parse_digits(value, position + 4, 2);
      if (!oh || !om || value[position + 3] != ':' || *oh > 23 || *om > 59) {
        return std::nullopt;
      }
      offset_minutes = sign * static_cast<int64_t>((*oh * 60) + *om);
      position += 6;
    } else {
      return std::nullopt;
    }
    if (position != value.size()) {
      return std::nullopt;
    }
  }

  auto parts = std::tm{};
  parts.tm_year = static_cast<int>(*year) - 1900;
  parts.tm_mon = static_cast<int>(*month) - 1;
  parts.tm_mday = static_cast<int>(*day);
  parts.tm_hour = static_cast<int>(hour);
  parts.tm_min = static_cast<int>(minute);
  parts.tm_sec = static_cast<int>(second);
  auto seconds = static_cast<int64_t>(timegm(&parts)) - (offset_minutes * 60);
  if (seconds < 0) {
    return std::nullopt;
  }
  return (static_cast<agentid::schema::timestamp_milliseconds_t>(seconds) *
          1000) +
         millis;
}

uint32_t utc_hour(agentid::schema::timestamp_milliseconds_t value) {
  return static_cast<uint32_t>(
      (value / agentid::schema::kMillisecondsPerHour) % 24);
}

uint32_t utc_minute_of_day(agentid::schema::timestamp_milliseconds_t value) {
  return static_cast<uint32_t>(
      (value / agentid::schema::kMillisecondsPerMinute) % (24 * 60));
}

uint32_t utc_weekday(agentid::schema::timestamp_milliseconds_t value) {
  // 1970-01-01 was a Thursday.
  auto days = value / agentid::schema::kMillisecondsPerDay;
  return static_cast<uint32_t>((days + 4) % 7);
}

}  // namespace agentid::common
