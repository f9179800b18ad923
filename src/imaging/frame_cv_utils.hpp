#pragma once

#include <gnomon/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace gnomon::imaging::detail {

/// Wrap a Frame as a cv::Mat view (no copy). Returns nullopt if format unsupported
/// or the buffer is smaller than the dimensions require.
std::optional<cv::Mat> frame_to_mat(const gnomon::core::Frame& frame);

/// Convert 8-bit cv::Mat to Frame (copy).
gnomon::core::Frame mat_to_frame(const cv::Mat& mat,
                                 gnomon::core::PixelFormat format);

}  // namespace gnomon::imaging::detail
