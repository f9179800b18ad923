#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <gnomon/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace gnomon::imaging {

/// Opaque background color, RGB order.
struct Rgb {
  std::uint8_t r{255};
  std::uint8_t g{255};
  std::uint8_t b{255};
};

/// Composites frames with an alpha channel onto an opaque background
/// (BGRA8 -> BGR8, RGBA8 -> RGB8). Frames without alpha pass through unchanged.
class FlattenAlphaStage : public gnomon::core::IPipelineStage {
 public:
  explicit FlattenAlphaStage(Rgb background = Rgb{});

  [[nodiscard]] std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
  process(const gnomon::core::Frame& input) override;

 private:
  Rgb background_;
};

}  // namespace gnomon::imaging
