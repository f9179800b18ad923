#include <gnomon/core/frame.hpp>
#include <cstddef>

namespace gnomon::core {

std::uint32_t channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool has_alpha(PixelFormat format) noexcept {
  return format == PixelFormat::RGBA8 || format == PixelFormat::BGRA8;
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channel_count(format);
}

}  // namespace gnomon::core
