#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <aeroinspect/vision/inference_result.hpp>
#include <cstdint>
#include <vector>

namespace aeroinspect::vision {

/// Decodes InferenceResult -> canonical primary detections.
///
/// Per candidate: drop below confidence_threshold or unknown class id, map the letterbox
/// box back to image pixels, clamp to the image (drop if nothing remains). Then class-scoped
/// NMS at nms_threshold and a stable sort by confidence, highest first.
class DefectDecoder {
 public:
  DefectDecoder(float confidence_threshold = 0.5f, float nms_threshold = 0.45f);

  [[nodiscard]] std::vector<aeroinspect::core::Detection> decode(
      const InferenceResult& result,
      const LetterboxTransform& letterbox,
      std::uint32_t image_width,
      std::uint32_t image_height) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }
  [[nodiscard]] float nms_threshold() const noexcept { return nms_threshold_; }

 private:
  float confidence_threshold_;
  float nms_threshold_;
};

}  // namespace aeroinspect::vision
