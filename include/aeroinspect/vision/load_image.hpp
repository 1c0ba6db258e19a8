#pragma once

#include <aeroinspect/core/frame.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace aeroinspect::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<aeroinspect::core::Frame> load_frame_from_image(const std::string& path);

/// Decode encoded image bytes (JPEG, PNG, ...) into a BGR8 Frame. Returns nullopt if undecodable.
std::optional<aeroinspect::core::Frame> decode_frame(std::span<const std::byte> encoded);

}  // namespace aeroinspect::vision
