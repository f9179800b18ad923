#include <gnomon/imaging/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace gnomon::imaging {

namespace nc = gnomon::core;

std::expected<nc::Frame, nc::PhotoError> load_frame_from_image(
    const std::filesystem::path& path) {
  cv::Mat mat;
  try {
    mat = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception&) {
    return std::unexpected(nc::PhotoError::LoadFailed);
  }
  if (mat.empty()) return std::unexpected(nc::PhotoError::LoadFailed);

  if (mat.depth() == CV_16U) {
    cv::Mat narrow;
    mat.convertTo(narrow, CV_8U, 1.0 / 257.0);
    mat = narrow;
  } else if (mat.depth() != CV_8U) {
    return std::unexpected(nc::PhotoError::InvalidFrame);
  }

  nc::PixelFormat format = nc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = nc::PixelFormat::Grayscale8;
      break;
    case 3:
      format = nc::PixelFormat::BGR8;
      break;
    case 4:
      format = nc::PixelFormat::BGRA8;
      break;
    default:
      return std::unexpected(nc::PhotoError::InvalidFrame);
  }

  return detail::mat_to_frame(mat, format);
}

}  // namespace gnomon::imaging
