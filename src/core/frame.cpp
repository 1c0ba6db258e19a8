#include <aeroinspect/core/frame.hpp>
#include <cstddef>

namespace aeroinspect::core {

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::Float32RGB:
      return pixels * 3 * sizeof(float);
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::is_consistent() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace aeroinspect::core
