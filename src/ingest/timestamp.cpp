#include <dmutil/ingest/timestamp.hpp>

#include <charconv>
#include <cstdio>
#include <ctime>

namespace dmutil::ingest {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

// Parse exactly `width` decimal digits starting at `pos`. No sign.
bool ParseFixed(std::string_view text, size_t pos, size_t width, int* out) {
  if (pos + width > text.size()) return false;
  for (size_t i = pos; i < pos + width; ++i) {
    if (!IsDigit(text[i])) return false;
  }
  const char* begin = text.data() + pos;
  const char* end = begin + width;
  auto result = std::from_chars(begin, end, *out);
  return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

bool ParseTimestamp(std::string_view text, Timestamp* out) {
  // Shortest accepted form: YYYY-MM-DDTHH:MM:SS
  if (text.size() < 19) return false;

  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ParseFixed(text, 0, 4, &year) || text[4] != '-' ||
      !ParseFixed(text, 5, 2, &month) || text[7] != '-' ||
      !ParseFixed(text, 8, 2, &day)) {
    return false;
  }

  // Accept 'T' or space as date/time separator
  if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') return false;

  if (!ParseFixed(text, 11, 2, &hour) || text[13] != ':' ||
      !ParseFixed(text, 14, 2, &minute) || text[16] != ':' ||
      !ParseFixed(text, 17, 2, &second)) {
    return false;
  }

  if (month < 1 || month > 12) return false;
  if (day < 1 || day > 31) return false;
  if (hour > 23 || minute > 59 || second > 59) return false;

  size_t pos = 19;

  // Fractional seconds, truncated to microseconds.
  int32_t micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && IsDigit(text[pos])) {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) return false;
    for (size_t i = digits; i < 6; ++i) micros *= 10;
  }

  // UTC offset
  int offset_seconds = 0;
  if (pos < text.size()) {
    char c = text[pos];
    if (c == 'Z' || c == 'z') {
      ++pos;
    } else if (c == '+' || c == '-') {
      int off_hour = 0, off_minute = 0;
      if (!ParseFixed(text, pos + 1, 2, &off_hour)) return false;
      size_t minute_pos = pos + 3;
      if (minute_pos < text.size() && text[minute_pos] == ':') ++minute_pos;
      if (!ParseFixed(text, minute_pos, 2, &off_minute)) return false;
      if (off_hour > 23 || off_minute > 59) return false;
      offset_seconds = off_hour * 3600 + off_minute * 60;
      if (c == '-') offset_seconds = -offset_seconds;
      pos = minute_pos + 2;
    } else {
      return false;
    }
  }
  if (pos != text.size()) return false;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  tm.tm_isdst = 0;

  time_t epoch = timegm(&tm);

  // timegm normalizes out-of-range days (Feb 30 -> Mar 2); reject those.
  if (tm.tm_mday != day || tm.tm_mon != month - 1) return false;

  out->seconds = static_cast<int64_t>(epoch) - offset_seconds;
  out->nanos = micros * 1000;
  return true;
}

std::string FormatTimestamp(const Timestamp& ts) {
  time_t time = static_cast<time_t>(ts.seconds);
  std::tm tm{};
  if (gmtime_r(&time, &tm) == nullptr) {
    return {};
  }

  char buffer[48];
  int written = std::snprintf(buffer, sizeof(buffer),
                              "%04d-%02d-%02dT%02d:%02d:%02d",
                              tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                              tm.tm_hour, tm.tm_min, tm.tm_sec);
  if (written < 0 || static_cast<size_t>(written) >= sizeof(buffer)) {
    return {};
  }

  std::string out(buffer, static_cast<size_t>(written));
  if (ts.nanos != 0) {
    char fraction[16];
    if (ts.nanos % 1000000 == 0) {
      std::snprintf(fraction, sizeof(fraction), ".%03d", ts.nanos / 1000000);
    } else if (ts.nanos % 1000 == 0) {
      std::snprintf(fraction, sizeof(fraction), ".%06d", ts.nanos / 1000);
    } else {
      std::snprintf(fraction, sizeof(fraction), ".%09d", ts.nanos);
    }
    out += fraction;
  }
  out += 'Z';
  return out;
}

}  // namespace dmutil::ingest
