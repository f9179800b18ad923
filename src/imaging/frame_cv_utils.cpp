#include "frame_cv_utils.hpp"
#include <gnomon/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace gnomon::imaging::detail {

namespace nc = gnomon::core;

std::optional<cv::Mat> frame_to_mat(const nc::Frame& frame) {
  if (frame.empty() || frame.width() == 0 || frame.height() == 0) return std::nullopt;
  if (frame.size_bytes() < nc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* pixels = const_cast<std::byte*>(frame.data().data());

  switch (nc::channel_count(frame.format())) {
    case 1:
      return cv::Mat(h, w, CV_8UC1, pixels, step);
    case 3:
      return cv::Mat(h, w, CV_8UC3, pixels, step);
    case 4:
      return cv::Mat(h, w, CV_8UC4, pixels, step);
    default:
      return std::nullopt;
  }
}

nc::Frame mat_to_frame(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Frame();

  const cv::Mat dense = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(dense.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(dense.rows);
  const std::size_t len = dense.total() * dense.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), dense.ptr(), len);
  return nc::Frame(w, h, format, std::move(buffer));
}

}  // namespace gnomon::imaging::detail
