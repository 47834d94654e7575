/**
 * @file time_grammar.cpp
 * @brief Duration and timestamp grammar implementation
 */

#include "clip_job/time_grammar.hpp"

#include <cctype>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "clip_job/errors.hpp"
#include "clip_job/text.hpp"

namespace clip_job {

// **---- Internal Helpers ----**

namespace {

constexpr size_t MAX_DURATION_PARTS = 3;
constexpr size_t MAX_FORMATTED_SIZE = 4096;

bool all_digits(const std::string &text) {
  if (text.empty())
    return false;
  for (unsigned char c : text) {
    if (!std::isdigit(c))
      return false;
  }
  return true;
}

/// Parse one unsigned decimal component of a duration
long long parse_component(const std::string &part, const std::string &text) {
  if (!all_digits(part)) {
    throw ParseError(fmt::format("invalid time component '{}' in '{}'", part,
                                 text));
  }
  try {
    return std::stoll(part);
  } catch (const std::out_of_range &) {
    throw ParseError(fmt::format("time out of range: '{}'", text));
  }
}

std::vector<std::string> split(const std::string &text, char sep) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    size_t end = text.find(sep, pos);
    if (end == std::string::npos) {
      parts.push_back(text.substr(pos));
      return parts;
    }
    parts.push_back(text.substr(pos, end - pos));
    pos = end + 1;
  }
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return days[month - 1];
}

/// Read a fixed-width digit field at text[pos, pos + width)
bool read_field(const std::string &text, size_t pos, size_t width, int &out) {
  std::string field = text.substr(pos, width);
  if (field.size() != width || !all_digits(field))
    return false;
  out = std::stoi(field);
  return true;
}

} // anonymous namespace

// **---- Durations ----**

Duration parse_duration(const std::string &text) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) {
    throw ParseError("empty time");
  }

  std::vector<std::string> parts = split(trimmed, ':');
  if (parts.size() > MAX_DURATION_PARTS) {
    throw ParseError(fmt::format("too many ':' separated parts in '{}'",
                                 trimmed));
  }

  /// Rightmost part is seconds, then minutes, then hours
  long long total = 0;
  long long unit = 1;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    long long value = parse_component(*it, trimmed);
    if (value > (std::numeric_limits<long long>::max() - total) / unit) {
      throw ParseError(fmt::format("time out of range: '{}'", trimmed));
    }
    total += value * unit;
    unit *= 60;
  }
  return Duration(total);
}

std::string format_duration_for_path(Duration duration) {
  long long total = duration.count();
  const char *sign = "";
  if (total < 0) {
    sign = "-";
    total = -total;
  }
  return fmt::format("{}{}-{:02d}-{:02d}", sign, total / 3600,
                     (total % 3600) / 60, total % 60);
}

// **---- Timestamps ----**

DateTime parse_timestamp(const std::string &text) {
  std::string trimmed = trim(text);

  /// Layout: YYYY-MM-DDTHH:MM:SS
  int year, month, day, hour, minute, second;
  bool ok = trimmed.size() == 19 && trimmed[4] == '-' && trimmed[7] == '-' &&
            trimmed[10] == 'T' && trimmed[13] == ':' && trimmed[16] == ':' &&
            read_field(trimmed, 0, 4, year) &&
            read_field(trimmed, 5, 2, month) &&
            read_field(trimmed, 8, 2, day) &&
            read_field(trimmed, 11, 2, hour) &&
            read_field(trimmed, 14, 2, minute) &&
            read_field(trimmed, 17, 2, second);
  if (!ok) {
    throw ParseError(fmt::format(
        "invalid timestamp '{}' (expected YYYY-MM-DDTHH:MM:SS)", trimmed));
  }

  if (month < 1 || month > 12 || day < 1 ||
      day > days_in_month(year, month) || hour > 23 || minute > 59 ||
      second > 59) {
    throw ParseError(fmt::format("timestamp out of range: '{}'", trimmed));
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  /// Calendar fields are kept as-is: UTC conversion avoids DST shifts
  std::time_t seconds = timegm(&tm);
  return DateTime(Duration(static_cast<long long>(seconds)));
}

DateTime shift_timestamp(DateTime timestamp, Duration offset) {
  long long base = timestamp.time_since_epoch().count();
  long long delta = offset.count();
  if ((delta > 0 && base > std::numeric_limits<long long>::max() - delta) ||
      (delta < 0 && base < std::numeric_limits<long long>::min() - delta)) {
    throw ParseError(fmt::format("time offset out of range: {}s", delta));
  }

  DateTime shifted = timestamp + offset;
  std::time_t seconds =
      static_cast<std::time_t>(shifted.time_since_epoch().count());
  std::tm tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    throw ParseError(fmt::format("time offset out of range: {}s", delta));
  }
  return shifted;
}

std::string format_timestamp(DateTime timestamp, const std::string &format) {
  std::time_t seconds =
      static_cast<std::time_t>(timestamp.time_since_epoch().count());
  std::tm tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    throw ValidationError(
        fmt::format("timestamp out of range: {}s", seconds));
  }

  std::string buffer;
  for (size_t size = format.size() * 4 + 64; size <= MAX_FORMATTED_SIZE;
       size *= 2) {
    buffer.resize(size);
    size_t written = std::strftime(&buffer[0], buffer.size(), format.c_str(),
                                   &tm);
    if (written > 0) {
      buffer.resize(written);
      return buffer;
    }
  }
  throw ValidationError(
      fmt::format("time format '{}' produces no output", format));
}

} // namespace clip_job
