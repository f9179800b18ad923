#include <gnomon/imaging/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace gnomon::imaging {

std::pair<std::uint32_t, std::uint32_t> fit_to_width(
    std::uint32_t width, std::uint32_t height, std::uint32_t max_width) noexcept {
  if (width == 0 || max_width == 0 || width <= max_width) return {width, height};
  const std::uint64_t scaled =
      static_cast<std::uint64_t>(height) * max_width / width;
  return {max_width, static_cast<std::uint32_t>(std::max<std::uint64_t>(scaled, 1))};
}

ResizeStage::ResizeStage(std::uint32_t max_width) : max_width_(max_width) {}

std::expected<gnomon::core::Frame, gnomon::core::PhotoError>
ResizeStage::process(const gnomon::core::Frame& input) {
  using namespace gnomon::core;

  if (input.empty()) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  const auto [target_width, target_height] =
      fit_to_width(input.width(), input.height(), max_width_);
  if (target_width == input.width() && target_height == input.height()) {
    return input;
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  cv::Mat mat_out;
  try {
    cv::resize(*mat_in, mat_out,
               cv::Size(static_cast<int>(target_width),
                        static_cast<int>(target_height)),
               0, 0, cv::INTER_LANCZOS4);
  } catch (const cv::Exception&) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  return detail::mat_to_frame(mat_out, input.format());
}

}  // namespace gnomon::imaging
