#pragma once

#include <aeroinspect/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace aeroinspect::vision::detail {

/// Wraps a Frame as a cv::Mat without copying. Returns nullopt if the format is unknown
/// or the buffer is too small for the declared geometry.
std::optional<cv::Mat> frame_to_mat(const aeroinspect::core::Frame& frame);

/// Converts any 8-bit Frame (gray, RGB, BGR) to an owned BGR8 cv::Mat.
std::optional<cv::Mat> frame_to_bgr(const aeroinspect::core::Frame& frame);

/// Copies a continuous or strided cv::Mat into a tightly packed Frame.
aeroinspect::core::Frame mat_to_frame(const cv::Mat& mat,
                                      aeroinspect::core::PixelFormat format);

}  // namespace aeroinspect::vision::detail
