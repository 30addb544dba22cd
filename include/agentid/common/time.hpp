#pragma once

#include <agentid/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace agentid::common {

/// Wall-clock source in milliseconds since the Unix epoch. Components take
/// one of these so that tests can move "now".
using clock_fn_t = std::function<agentid::schema::timestamp_milliseconds_t()>;

clock_fn_t system_clock();

/// Format as ISO-8601 UTC with milliseconds, e.g. 2025-01-01T00:00:00.000Z.
std::string format_iso8601(agentid::schema::timestamp_milliseconds_t value);

/// Parse ISO-8601 date-times: "YYYY-MM-DDTHH:MM:SS", optional fraction,
/// then "Z" or a +HH:MM / -HH:MM offset. Date-only input is midnight UTC.
std::optional<agentid::schema::timestamp_milliseconds_t> parse_iso8601(
    std::string_view value);

/// UTC hour (0..23) and weekday (0 = Sunday) of a timestamp.
uint32_t utc_hour(agentid::schema::timestamp_milliseconds_t value);
uint32_t utc_minute_of_day(agentid::schema::timestamp_milliseconds_t value);
uint32_t utc_weekday(agentid::schema::timestamp_milliseconds_t value);

}  // namespace agentid::common
