#include <aeroinspect/core/ensemble_config.hpp>
#include <cmath>

namespace aeroinspect::core {

namespace {

bool in_unit_range(float v) { return std::isfinite(v) && v >= 0.f && v <= 1.f; }

}  // namespace

std::expected<void, std::string> EnsembleConfig::validate() const {
  if (!in_unit_range(primary_weight) || !in_unit_range(secondary_weight)) {
    return std::unexpected("ensemble weights must lie in [0, 1]");
  }
  const double sum = static_cast<double>(primary_weight) + secondary_weight;
  if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
    return std::unexpected("primary_weight + secondary_weight must equal 1.0 (got " +
                           std::to_string(sum) + ")");
  }
  if (!in_unit_range(match_iou_threshold)) {
    return std::unexpected("match_iou_threshold must lie in [0, 1]");
  }
  if (!in_unit_range(nms_iou_threshold)) {
    return std::unexpected("nms_iou_threshold must lie in [0, 1]");
  }
  if (!in_unit_range(single_detector_min_confidence)) {
    return std::unexpected("single_detector_min_confidence must lie in [0, 1]");
  }
  if (!in_unit_range(min_final_confidence)) {
    return std::unexpected("min_final_confidence must lie in [0, 1]");
  }
  return {};
}

}  // namespace aeroinspect::core
