#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace aeroinspect::vision {

struct PreprocessorConfig {
  std::uint32_t min_dimension{640};
  std::uint32_t max_dimension{4096};
  std::uint32_t model_input_size{640};  // square letterbox side
  double quality_floor{60.0};           // below this a warning is attached
  double clahe_clip_limit{2.0};
  int clahe_tile_grid{8};
  std::uint8_t letterbox_pad_value{114};
};

/// Maps model-input (letterbox) pixel coordinates back to original image pixels.
struct LetterboxTransform {
  float scale{1.f};
  float pad_x{0.f};
  float pad_y{0.f};

  /// Converts a model-space corner box (x1, y1, x2, y2) to an image-space BBox (unclamped).
  [[nodiscard]] aeroinspect::core::BBox to_image(float x1, float y1, float x2, float y2) const noexcept {
    return {(x1 - pad_x) / scale, (y1 - pad_y) / scale, (x2 - x1) / scale, (y2 - y1) / scale};
  }
};

/// Result of preprocessing one image.
struct PreprocessedImage {
  aeroinspect::core::Frame normalized;   // BGR8, original resolution, equalized and filtered
  aeroinspect::core::Frame model_input;  // BGR8, model_input_size square letterbox of normalized
  LetterboxTransform letterbox;
  double quality_score{0.0};  // 0..100, measured on the unprocessed image
  std::vector<std::string> warnings;

  [[nodiscard]] std::uint32_t width() const noexcept { return normalized.width(); }
  [[nodiscard]] std::uint32_t height() const noexcept { return normalized.height(); }
};

/// Validates and normalizes images before detection. Pure; safe to share between threads.
///
/// Steps: dimension check against [min_dimension, max_dimension] (both sides), quality score
/// (sharpness from Laplacian variance, brightness from deviation to mid-gray), CLAHE on the
/// L channel, bilateral filtering with glare/shadow compensation, letterbox to the model size.
/// Low quality is a warning, never a failure.
class ImagePreprocessor {
 public:
  explicit ImagePreprocessor(PreprocessorConfig config = {});

  /// Accepts BGR8, RGB8 or Grayscale8 frames.
  /// Errors: InvalidImage (empty/inconsistent buffer), DimensionsOutOfRange.
  [[nodiscard]] std::expected<PreprocessedImage, aeroinspect::core::PipelineError>
  preprocess(const aeroinspect::core::Frame& image) const;

  /// Decodes then preprocesses. Undecodable bytes give InvalidImage.
  [[nodiscard]] std::expected<PreprocessedImage, aeroinspect::core::PipelineError>
  preprocess_encoded(std::span<const std::byte> encoded) const;

  /// Quality score in [0, 100] of a BGR8/RGB8/Grayscale8 frame.
  [[nodiscard]] std::expected<double, aeroinspect::core::PipelineError>
  quality_score(const aeroinspect::core::Frame& image) const;

  [[nodiscard]] const PreprocessorConfig& config() const noexcept { return config_; }

 private:
  PreprocessorConfig config_;
};

}  // namespace aeroinspect::vision
