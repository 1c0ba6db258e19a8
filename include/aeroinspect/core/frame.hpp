#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace aeroinspect::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>).
/// Thread-safety: a const Frame may be read from several detector threads at once;
/// mutation requires external synchronization.

/// Pixel layout.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  RGB8,
  Float32RGB,  // HWC, 3 x float per pixel, model input
};

/// Decoded image: dimensions, pixel format and owned, tightly packed pixel buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer holds at least min_bytes() for the declared geometry.
  [[nodiscard]] bool is_consistent() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace aeroinspect::core
