#include <aeroinspect/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/core/log.hpp>
#include <opencv2/imgcodecs.hpp>

namespace aeroinspect::vision {

std::optional<aeroinspect::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path);
  if (mat.empty()) return std::nullopt;

  aeroinspect::core::PixelFormat format = aeroinspect::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = aeroinspect::core::PixelFormat::Grayscale8;

  return detail::mat_to_frame(mat, format);
}

std::optional<aeroinspect::core::Frame> decode_frame(std::span<const std::byte> encoded) {
  if (encoded.empty()) return std::nullopt;

  cv::Mat mat;
  try {
    const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                      const_cast<std::byte*>(encoded.data()));
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    aeroinspect::core::logger()->warn("image decode failed: {}", e.what());
    return std::nullopt;
  }
  if (mat.empty()) return std::nullopt;
  return detail::mat_to_frame(mat, aeroinspect::core::PixelFormat::BGR8);
}

}  // namespace aeroinspect::vision
