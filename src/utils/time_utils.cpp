#include "utils/time_utils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {
// 9999-12-31T23:59:59.999Z
constexpr int64_t MAX_RELAXED_MILLIS = 253402300799999LL;

bool readDigits(std::string_view text, size_t &pos, size_t count, int &out) {
  if (pos + count > text.size())
    return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(std::string_view text, size_t &pos, char c) {
  if (pos >= text.size() || text[pos] != c)
    return false;
  ++pos;
  return true;
}
} // namespace

std::string formatIso8601(int64_t millis) {
  int64_t seconds = millis / 1000;
  int64_t ms = millis % 1000;
  if (ms < 0) {
    ms += 1000;
    seconds -= 1;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  struct tm tm_buf;
  if (!gmtime_r(&t, &tm_buf)) {
    return std::to_string(millis);
  }

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "."
     << std::setfill('0') << std::setw(3) << ms << "Z";
  return ss.str();
}

std::optional<int64_t> parseIso8601(std::string_view text) {
  size_t pos = 0;
  int year, month, day, hour, minute, second;
  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day) || !expect(text, pos, 'T') ||
      !readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }

  int64_t fraction = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3)
        fraction = fraction * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      return std::nullopt;
    for (int i = digits; i < 3; ++i)
      fraction *= 10;
  }

  int64_t offsetSeconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int oh, om;
    if (!readDigits(text, pos, 2, oh))
      return std::nullopt;
    if (pos < text.size() && text[pos] == ':')
      ++pos;
    if (!readDigits(text, pos, 2, om))
      return std::nullopt;
    offsetSeconds = sign * (oh * 3600 + om * 60);
  } else {
    return std::nullopt;
  }
  if (pos != text.size())
    return std::nullopt;

  struct tm tm_buf = {};
  tm_buf.tm_year = year - 1900;
  tm_buf.tm_mon = month - 1;
  tm_buf.tm_mday = day;
  tm_buf.tm_hour = hour;
  tm_buf.tm_min = minute;
  tm_buf.tm_sec = second;
  int64_t epochSeconds = static_cast<int64_t>(timegm(&tm_buf));
  return (epochSeconds - offsetSeconds) * 1000 + fraction;
}

bool isRelaxedDateRange(int64_t millis) {
  return millis >= 0 && millis <= MAX_RELAXED_MILLIS;
}

} // namespace TimeUtils
