#pragma once

#include <gnomon/core/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gnomon::metadata {

/// EXIF metadata of one source image.
/// payload is the TIFF structure that follows the "Exif\0\0" header of a JPEG APP1
/// segment. For JPEG sources it is the original bytes, untouched; for other formats
/// it is re-serialized from the parsed tags.
struct ExifBlock {
  std::vector<std::byte> payload;
  std::optional<std::string> date_time_original;
  std::optional<std::string> date_time_digitized;
};

using ExifReadResult = std::expected<ExifBlock, gnomon::core::PhotoError>;

/// Run read, turning any std::exception it throws into MetadataUnavailable.
[[nodiscard]] ExifReadResult guard_exif_read(const std::function<ExifReadResult()>& read);

/// Read the EXIF block of an image file. MetadataUnavailable when the file cannot
/// be opened or parsed, or carries no EXIF tags. Never throws on malformed input.
[[nodiscard]] ExifReadResult read_exif_block(const std::filesystem::path& path);

}  // namespace gnomon::metadata
