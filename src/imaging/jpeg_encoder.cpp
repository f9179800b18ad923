#include <gnomon/imaging/jpeg_encoder.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>

namespace gnomon::imaging {

std::expected<std::vector<std::byte>, gnomon::core::PhotoError>
encode_jpeg(const gnomon::core::Frame& frame, const JpegOptions& options) {
  using namespace gnomon::core;

  if (frame.format() != PixelFormat::BGR8 && frame.format() != PixelFormat::Grayscale8) {
    return std::unexpected(PhotoError::InvalidFrame);
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  const std::vector<int> params = {
      cv::IMWRITE_JPEG_QUALITY, std::clamp(options.quality, 1, 100),
      cv::IMWRITE_JPEG_OPTIMIZE, options.optimize ? 1 : 0,
      cv::IMWRITE_JPEG_PROGRESSIVE, options.progressive ? 1 : 0,
  };

  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(".jpg", *mat, encoded, params)) {
      return std::unexpected(PhotoError::EncodeFailed);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(PhotoError::EncodeFailed);
  }

  std::vector<std::byte> out(encoded.size());
  std::transform(encoded.begin(), encoded.end(), out.begin(),
                 [](uchar b) { return static_cast<std::byte>(b); });
  return out;
}

}  // namespace gnomon::imaging
