#include <gnomon/core/capture_timestamp.hpp>
#include <charconv>
#include <cstdio>

namespace gnomon::core {

namespace {

constexpr std::string_view kExifPattern = "dddd:dd:dd dd:dd:dd";

bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

int read_field(std::string_view text, std::size_t pos, std::size_t len) {
  int value = 0;
  std::from_chars(text.data() + pos, text.data() + pos + len, value);
  return value;
}

}  // namespace

std::optional<CaptureTimestamp> parse_exif_datetime(std::string_view text) {
  while (!text.empty() &&
         (text.back() == '\0' || text.back() == ' ' || text.back() == '\n' ||
          text.back() == '\r' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  if (text.size() != kExifPattern.size()) return std::nullopt;

  for (std::size_t i = 0; i < kExifPattern.size(); ++i) {
    const char expected = kExifPattern[i];
    const char c = text[i];
    if (expected == 'd') {
      if (c < '0' || c > '9') return std::nullopt;
    } else if (c != expected) {
      return std::nullopt;
    }
  }

  CaptureTimestamp ts;
  ts.year = read_field(text, 0, 4);
  ts.month = read_field(text, 5, 2);
  ts.day = read_field(text, 8, 2);
  ts.hour = read_field(text, 11, 2);
  ts.minute = read_field(text, 14, 2);
  ts.second = read_field(text, 17, 2);

  if (ts.year < 1) return std::nullopt;
  if (ts.month < 1 || ts.month > 12) return std::nullopt;
  if (ts.day < 1 || ts.day > days_in_month(ts.year, ts.month)) return std::nullopt;
  if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) return std::nullopt;
  return ts;
}

CaptureTimestamp from_time_t(std::time_t seconds) {
  std::tm local{};
  localtime_r(&seconds, &local);
  CaptureTimestamp ts;
  ts.year = local.tm_year + 1900;
  ts.month = local.tm_mon + 1;
  ts.day = local.tm_mday;
  ts.hour = local.tm_hour;
  ts.minute = local.tm_min;
  ts.second = local.tm_sec;
  return ts;
}

std::string format_name_stamp(const CaptureTimestamp& ts) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d-%02d%02d",
                ts.year, ts.month, ts.day, ts.hour, ts.minute);
  return buf;
}

std::string to_string(const CaptureTimestamp& ts) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                ts.year, ts.month, ts.day, ts.hour, ts.minute, ts.second);
  return buf;
}

}  // namespace gnomon::core
