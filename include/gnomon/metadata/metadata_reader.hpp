#pragma once

#include <gnomon/core/capture_timestamp.hpp>
#include <gnomon/core/reporter.hpp>
#include <gnomon/metadata/exif_block.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace gnomon::metadata {

/// Where a capture timestamp came from.
enum class TimestampOrigin : std::uint8_t {
  DateTimeOriginal,
  DateTimeDigitized,
  FileModified,
};

[[nodiscard]] std::string_view origin_name(TimestampOrigin origin) noexcept;

struct TimestampReading {
  gnomon::core::CaptureTimestamp timestamp;
  TimestampOrigin origin{TimestampOrigin::FileModified};
};

/// One embedded candidate source of the capture time; nullopt when it has
/// nothing usable (tag missing or not in EXIF date-time form).
struct TimestampProvider {
  TimestampOrigin origin;
  std::function<std::optional<gnomon::core::CaptureTimestamp>(const ExifBlock&)> read;
};

/// DateTimeOriginal, then DateTimeDigitized.
[[nodiscard]] std::vector<TimestampProvider> default_timestamp_providers();

/// Last-modified time of path in local time. Falls back to the current time if
/// the file cannot be stat'ed.
[[nodiscard]] gnomon::core::CaptureTimestamp file_modified_timestamp(
    const std::filesystem::path& path) noexcept;

/// Resolves the capture time of a source image: each provider in order against
/// the file's EXIF block, then the file modification time. Falling back to the
/// modification time is reported as a warning; it is never an error.
class MetadataReader {
 public:
  explicit MetadataReader(gnomon::core::IReporter& reporter,
                          std::vector<TimestampProvider> providers =
                              default_timestamp_providers());

  [[nodiscard]] TimestampReading read(const std::filesystem::path& path) const;

  /// Same, from an EXIF block already read from path.
  [[nodiscard]] TimestampReading read(const std::filesystem::path& path,
                                      const ExifReadResult& exif) const;

 private:
  gnomon::core::IReporter& reporter_;
  std::vector<TimestampProvider> providers_;
};

}  // namespace gnomon::metadata
