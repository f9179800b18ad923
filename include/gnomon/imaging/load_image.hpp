#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <expected>
#include <filesystem>

namespace gnomon::imaging {

/// Decode an image file into a Frame, keeping its alpha channel.
/// Result is Grayscale8, BGR8 or BGRA8; 16-bit samples are scaled to 8-bit.
/// LoadFailed if the file cannot be decoded.
[[nodiscard]] std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
load_frame_from_image(const std::filesystem::path& path);

}  // namespace gnomon::imaging
