#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <gnomon/core/pipeline_stage.hpp>
#include <expected>

namespace gnomon::imaging {

/// Converts frames to the given direct-color format (default BGR8, the JPEG
/// encoder's input order). Alpha, if still present, is dropped.
class ColorConvertStage : public gnomon::core::IPipelineStage {
 public:
  explicit ColorConvertStage(
      gnomon::core::PixelFormat output_format = gnomon::core::PixelFormat::BGR8);

  [[nodiscard]] std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
  process(const gnomon::core::Frame& input) override;

 private:
  gnomon::core::PixelFormat output_format_;
};

}  // namespace gnomon::imaging
