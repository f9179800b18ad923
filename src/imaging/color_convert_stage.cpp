#include <gnomon/imaging/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace gnomon::imaging {

namespace {

using gnomon::core::PixelFormat;

int conversion_code(PixelFormat from, PixelFormat to) {
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::BGR8) return cv::COLOR_GRAY2BGR;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::RGB8) return cv::COLOR_GRAY2RGB;
  if (from == PixelFormat::RGB8 && to == PixelFormat::BGR8) return cv::COLOR_RGB2BGR;
  if (from == PixelFormat::BGR8 && to == PixelFormat::RGB8) return cv::COLOR_BGR2RGB;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::BGR8) return cv::COLOR_BGRA2BGR;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::RGB8) return cv::COLOR_BGRA2RGB;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::RGB8) return cv::COLOR_RGBA2RGB;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::BGR8) return cv::COLOR_RGBA2BGR;
  if (from == PixelFormat::BGR8 && to == PixelFormat::Grayscale8) return cv::COLOR_BGR2GRAY;
  if (from == PixelFormat::RGB8 && to == PixelFormat::Grayscale8) return cv::COLOR_RGB2GRAY;
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(gnomon::core::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
ColorConvertStage::process(const gnomon::core::Frame& input) {
  using namespace gnomon::core;

  if (input.empty()) {
    return std::unexpected(PhotoError::InvalidFrame);
  }
  if (input.format() == output_format_) {
    return input;
  }

  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  cv::Mat mat_out;
  try {
    cv::cvtColor(*mat_in, mat_out, code);
  } catch (const cv::Exception&) {
    return std::unexpected(PhotoError::InvalidFrame);
  }
  return detail::mat_to_frame(mat_out, output_format_);
}

}  // namespace gnomon::imaging
