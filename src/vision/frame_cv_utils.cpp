#include "frame_cv_utils.hpp"
#include <aeroinspect/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace aeroinspect::vision::detail {

namespace ac = aeroinspect::core;

std::optional<cv::Mat> frame_to_mat(const ac::Frame& frame) {
  if (!frame.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case ac::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case ac::PixelFormat::RGB8:
    case ac::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case ac::PixelFormat::Float32RGB:
      return cv::Mat(h, w, CV_32FC3, data);
    case ac::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> frame_to_bgr(const ac::Frame& frame) {
  auto view = frame_to_mat(frame);
  if (!view) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case ac::PixelFormat::BGR8:
      bgr = view->clone();
      break;
    case ac::PixelFormat::RGB8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGB2BGR);
      break;
    case ac::PixelFormat::Grayscale8:
      cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
      break;
    default:
      return std::nullopt;
  }
  return bgr;
}

ac::Frame mat_to_frame(const cv::Mat& mat, ac::PixelFormat format) {
  if (mat.empty()) return ac::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ac::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace aeroinspect::vision::detail
