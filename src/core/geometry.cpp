#include <aeroinspect/core/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace aeroinspect::core {

float iou(const BBox& a, const BBox& b) noexcept {
  const float left = std::max(a.x, b.x);
  const float top = std::max(a.y, b.y);
  const float right = std::min(a.right(), b.right());
  const float bottom = std::min(a.bottom(), b.bottom());
  if (right <= left || bottom <= top) {
    return 0.f;
  }
  const float intersection = (right - left) * (bottom - top);
  const float union_area = a.area() + b.area() - intersection;
  return union_area > 0.f ? intersection / union_area : 0.f;
}

bool is_well_formed(const BBox& b) noexcept {
  return std::isfinite(b.x) && std::isfinite(b.y) && std::isfinite(b.width) &&
         std::isfinite(b.height) && b.width > 0.f && b.height > 0.f;
}

bool is_within(const BBox& b, std::uint32_t width, std::uint32_t height) noexcept {
  return b.x >= 0.f && b.y >= 0.f && b.right() <= static_cast<float>(width) &&
         b.bottom() <= static_cast<float>(height);
}

std::optional<BBox> clamp_to_image(const BBox& b,
                                   std::uint32_t width,
                                   std::uint32_t height) noexcept {
  if (!std::isfinite(b.x) || !std::isfinite(b.y) || !std::isfinite(b.width) ||
      !std::isfinite(b.height)) {
    return std::nullopt;
  }
  const float x1 = std::clamp(b.x, 0.f, static_cast<float>(width));
  const float y1 = std::clamp(b.y, 0.f, static_cast<float>(height));
  const float x2 = std::clamp(b.right(), 0.f, static_cast<float>(width));
  const float y2 = std::clamp(b.bottom(), 0.f, static_cast<float>(height));
  if (x2 <= x1 || y2 <= y1) {
    return std::nullopt;
  }
  return BBox{x1, y1, x2 - x1, y2 - y1};
}

void sort_by_confidence(std::vector<Detection>& detections) {
  std::stable_sort(detections.begin(), detections.end(),
                   [](const Detection& a, const Detection& b) {
                     return a.confidence > b.confidence;
                   });
}

std::vector<Detection> suppress_overlaps(std::vector<Detection> detections,
                                         float iou_threshold) {
  sort_by_confidence(detections);
  std::vector<Detection> kept;
  kept.reserve(detections.size());
  for (auto& candidate : detections) {
    const bool suppressed = std::any_of(
        kept.begin(), kept.end(), [&](const Detection& k) {
          return k.defect_class == candidate.defect_class &&
                 iou(k.bbox, candidate.bbox) >= iou_threshold;
        });
    if (!suppressed) {
      kept.push_back(std::move(candidate));
    }
  }
  return kept;
}

}  // namespace aeroinspect::core
