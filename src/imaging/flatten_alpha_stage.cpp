#include <gnomon/imaging/flatten_alpha_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace gnomon::imaging {

FlattenAlphaStage::FlattenAlphaStage(Rgb background) : background_(background) {}

std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
FlattenAlphaStage::process(const gnomon::core::Frame& input) {
  using namespace gnomon::core;

  if (input.empty()) {
    return std::unexpected(PhotoError::InvalidFrame);
  }
  if (!has_alpha(input.format())) {
    return input;
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  const bool bgr_order = input.format() == PixelFormat::BGRA8;
  const cv::Scalar background =
      bgr_order ? cv::Scalar(background_.b, background_.g, background_.r)
                : cv::Scalar(background_.r, background_.g, background_.b);

  cv::Mat flat;
  try {
    std::vector<cv::Mat> channels;
    cv::split(*mat_in, channels);

    cv::Mat color;
    cv::merge(std::vector<cv::Mat>{channels[0], channels[1], channels[2]}, color);
    cv::Mat color_f;
    color.convertTo(color_f, CV_32FC3);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
    cv::Mat alpha3;
    cv::merge(std::vector<cv::Mat>{alpha, alpha, alpha}, alpha3);
    cv::Mat inverse = cv::Scalar::all(1.0) - alpha3;

    cv::Mat backdrop(color.size(), CV_32FC3, background);
    cv::Mat blended = color_f.mul(alpha3) + backdrop.mul(inverse);
    blended.convertTo(flat, CV_8UC3);
  } catch (const cv::Exception&) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  return detail::mat_to_frame(flat, bgr_order ? PixelFormat::BGR8 : PixelFormat::RGB8);
}

}  // namespace gnomon::imaging
