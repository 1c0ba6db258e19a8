#pragma once

#include <cstdint>
#include <vector>

namespace aeroinspect::vision {

/// Raw model output before decoding to Detection records.
/// Boxes are corner coordinates in model-input (letterbox) pixels.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace aeroinspect::vision
