#pragma once

#include <gnomon/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace gnomon::metadata {

/// Largest EXIF payload that fits in one APP1 segment (64 KiB minus length
/// field and "Exif\0\0" header).
inline constexpr std::size_t kMaxExifPayload = 0xFFFF - 2 - 6;

/// Payload (after "Exif\0\0") of the first APP1 Exif segment before the image
/// data, or nullopt if the stream is not a JPEG or has none.
[[nodiscard]] std::optional<std::vector<std::byte>> find_exif_payload(
    std::span<const std::byte> jpeg);

/// Copy of jpeg with payload inserted as an APP1 Exif segment, placed after SOI
/// and a leading APP0 (JFIF) segment if present. Any APP1 Exif segment already in
/// jpeg is dropped.
[[nodiscard]] std::expected<std::vector<std::byte>, gnomon::core::PhotoError>
embed_exif_payload(std::span<const std::byte> jpeg, std::span<const std::byte> payload);

}  // namespace gnomon::metadata
