#include <gnomon/metadata/metadata_reader.hpp>
#include <chrono>
#include <ctime>
#include <string>
#include <system_error>
#include <utility>

namespace gnomon::metadata {

namespace nc = gnomon::core;

namespace {

std::optional<nc::CaptureTimestamp> parse_field(const std::optional<std::string>& field) {
  if (!field) return std::nullopt;
  return nc::parse_exif_datetime(*field);
}

}  // namespace

std::string_view origin_name(TimestampOrigin origin) noexcept {
  switch (origin) {
    case TimestampOrigin::DateTimeOriginal:
      return "DateTimeOriginal";
    case TimestampOrigin::DateTimeDigitized:
      return "DateTimeDigitized";
    case TimestampOrigin::FileModified:
      return "file modification time";
  }
  return "unknown";
}

std::vector<TimestampProvider> default_timestamp_providers() {
  return {
      {TimestampOrigin::DateTimeOriginal,
       [](const ExifBlock& block) { return parse_field(block.date_time_original); }},
      {TimestampOrigin::DateTimeDigitized,
       [](const ExifBlock& block) { return parse_field(block.date_time_digitized); }},
  };
}

nc::CaptureTimestamp file_modified_timestamp(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  const auto file_time = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return nc::from_time_t(std::time(nullptr));
  }
  const auto sys_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(file_time));
  return nc::from_time_t(std::chrono::system_clock::to_time_t(sys_time));
}

MetadataReader::MetadataReader(nc::IReporter& reporter,
                               std::vector<TimestampProvider> providers)
    : reporter_(reporter), providers_(std::move(providers)) {}

TimestampReading MetadataReader::read(const std::filesystem::path& path) const {
  return read(path, read_exif_block(path));
}

TimestampReading MetadataReader::read(const std::filesystem::path& path,
                                      const ExifReadResult& block) const {
  const std::string name = path.filename().string();

  if (!block) {
    reporter_.warning("Error reading EXIF from " + name + " (" +
                      std::string(nc::describe(block.error())) +
                      "), using file modification time");
  } else {
    for (const TimestampProvider& provider : providers_) {
      if (!provider.read) continue;
      if (auto ts = provider.read(*block)) {
        return {*ts, provider.origin};
      }
    }
    reporter_.warning("No EXIF datetime found for " + name +
                      ", using file modification time");
  }

  return {file_modified_timestamp(path), TimestampOrigin::FileModified};
}

}  // namespace gnomon::metadata
