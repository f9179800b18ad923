#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace gnomon::core {

/// Calendar date-time of capture, local wall-clock time, second resolution.
struct CaptureTimestamp {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};

  friend bool operator==(const CaptureTimestamp&, const CaptureTimestamp&) = default;
};

/// Parse the EXIF date-time text "YYYY:MM:DD HH:MM:SS". Trailing NULs and
/// whitespace are ignored; anything else that deviates from the pattern, or a
/// field out of calendar range, yields nullopt.
[[nodiscard]] std::optional<CaptureTimestamp> parse_exif_datetime(std::string_view text);

/// Convert seconds since the epoch to local calendar time.
[[nodiscard]] CaptureTimestamp from_time_t(std::time_t seconds);

/// "YYYY-MM-DD-HHMM", the date part of output file names.
[[nodiscard]] std::string format_name_stamp(const CaptureTimestamp& ts);

/// "YYYY-MM-DD HH:MM:SS", for reporting.
[[nodiscard]] std::string to_string(const CaptureTimestamp& ts);

}  // namespace gnomon::core
