#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <gnomon/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>
#include <utility>

namespace gnomon::imaging {

/// Output size for a width cap: (max_width, floor(height * max_width / width)),
/// height at least 1. Frames at or under the cap keep their size.
[[nodiscard]] std::pair<std::uint32_t, std::uint32_t> fit_to_width(
    std::uint32_t width, std::uint32_t height, std::uint32_t max_width) noexcept;

/// Downscales frames wider than max_width with Lanczos resampling, preserving
/// aspect ratio. Never upscales.
class ResizeStage : public gnomon::core::IPipelineStage {
 public:
  explicit ResizeStage(std::uint32_t max_width);

  [[nodiscard]] std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
  process(const gnomon::core::Frame& input) override;

 private:
  std::uint32_t max_width_;
};

}  // namespace gnomon::imaging
