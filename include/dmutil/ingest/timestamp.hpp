#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dmutil::ingest {

/** Point in time as seconds since the Unix epoch (UTC) plus nanoseconds. */
struct Timestamp {
  int64_t seconds = 0;
  int32_t nanos = 0;

  bool operator==(const Timestamp& other) const {
    return seconds == other.seconds && nanos == other.nanos;
  }
};

/**
 * Parse an ISO 8601 date-time:
 *   YYYY-MM-DD(T| )HH:MM:SS[.fraction][Z|z|+HH:MM|-HH:MM|+HHMM|-HHMM]
 *
 * No offset means UTC. Fractional seconds are kept to microsecond
 * precision.
 *
 * @return false if the text is not a valid date-time.
 */
bool ParseTimestamp(std::string_view text, Timestamp* out);

/**
 * Format as RFC 3339 in UTC with a 'Z' suffix. A non-zero fraction is
 * written with 3 or 6 digits.
 */
std::string FormatTimestamp(const Timestamp& ts);

}  // namespace dmutil::ingest
