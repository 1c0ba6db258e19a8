#pragma once

#include <expected>
#include <string>

namespace aeroinspect::core {

/// Weights and thresholds for merging primary and secondary detections.
/// Loaded once at startup and shared read-only by every job.
struct EnsembleConfig {
  float primary_weight{0.6f};
  float secondary_weight{0.4f};
  float match_iou_threshold{0.5f};
  float nms_iou_threshold{0.4f};
  float single_detector_min_confidence{0.7f};
  float min_final_confidence{0.5f};

  static constexpr float kWeightSumTolerance = 1e-6f;

  /// Rejects weights that do not sum to 1 (never renormalizes) and thresholds outside [0, 1].
  /// The error string names the offending field.
  [[nodiscard]] std::expected<void, std::string> validate() const;
};

}  // namespace aeroinspect::core
