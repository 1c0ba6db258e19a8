#include <aeroinspect/vision/defect_decoder.hpp>
#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/geometry.hpp>
#include <aeroinspect/core/log.hpp>
#include <algorithm>
#include <cstddef>

namespace aeroinspect::vision {

namespace ac = aeroinspect::core;

DefectDecoder::DefectDecoder(float confidence_threshold, float nms_threshold)
    : confidence_threshold_(confidence_threshold), nms_threshold_(nms_threshold) {}

std::vector<ac::Detection> DefectDecoder::decode(const InferenceResult& result,
                                                 const LetterboxTransform& letterbox,
                                                 std::uint32_t image_width,
                                                 std::uint32_t image_height) const {
  std::vector<ac::Detection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  std::size_t unknown_class = 0;

  for (std::size_t i = 0; i < n; ++i) {
    if (i >= result.scores.size() || i >= result.class_ids.size() ||
        i * 4 + 3 >= result.boxes.size()) {
      break;
    }
    const float score = result.scores[i];
    if (!(score >= confidence_threshold_)) {
      continue;
    }
    const auto defect_class = ac::defect_class_from_id(result.class_ids[i]);
    if (!defect_class) {
      ++unknown_class;
      continue;
    }

    const ac::BBox mapped = letterbox.to_image(result.boxes[i * 4 + 0], result.boxes[i * 4 + 1],
                                               result.boxes[i * 4 + 2], result.boxes[i * 4 + 3]);
    if (!ac::is_well_formed(mapped)) {
      continue;
    }
    const auto clamped = ac::clamp_to_image(mapped, image_width, image_height);
    if (!clamped) {
      continue;
    }

    ac::Detection d;
    d.defect_class = *defect_class;
    d.confidence = std::min(score, 1.f);
    d.bbox = *clamped;
    d.source = ac::DetectionSource::Primary;
    out.push_back(std::move(d));
  }

  if (unknown_class > 0) {
    ac::logger()->warn("decoder dropped {} candidate(s) with unknown class id", unknown_class);
  }
  return ac::suppress_overlaps(std::move(out), nms_threshold_);
}

}  // namespace aeroinspect::vision
