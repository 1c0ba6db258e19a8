#pragma once

#include <aeroinspect/core/defect.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace aeroinspect::core {

/// Intersection over union of two axis-aligned boxes: 0 when disjoint (or touching), 1 when identical.
[[nodiscard]] float iou(const BBox& a, const BBox& b) noexcept;

/// Finite coordinates and strictly positive width/height.
[[nodiscard]] bool is_well_formed(const BBox& b) noexcept;

/// True when the box lies inside [0, width] x [0, height].
[[nodiscard]] bool is_within(const BBox& b, std::uint32_t width, std::uint32_t height) noexcept;

/// Intersects the box with the image rectangle; nullopt if nothing with positive area remains.
[[nodiscard]] std::optional<BBox> clamp_to_image(const BBox& b,
                                                 std::uint32_t width,
                                                 std::uint32_t height) noexcept;

/// Class-scoped non-maximum suppression: visits detections by confidence (descending,
/// stable on ties) and drops any detection whose IoU with an already kept detection
/// of the same class is >= iou_threshold. Output is sorted by confidence descending.
[[nodiscard]] std::vector<Detection> suppress_overlaps(std::vector<Detection> detections,
                                                       float iou_threshold);

/// Stable sort by confidence, highest first.
void sort_by_confidence(std::vector<Detection>& detections);

}  // namespace aeroinspect::core
