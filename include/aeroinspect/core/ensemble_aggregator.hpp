#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/ensemble_config.hpp>
#include <span>
#include <string>
#include <vector>

namespace aeroinspect::core {

/// Aggregated detections plus the non-fatal problems met on the way (dropped malformed boxes).
struct AggregationOutcome {
  std::vector<Detection> detections;
  std::vector<std::string> warnings;
};

/// Merges primary and secondary detections into one deduplicated, confidence-ranked list.
///
/// 1. Same-class pairs with IoU >= match threshold are matched greedily, best IoU first;
///    each matched pair becomes one detection (averaged box, mean confidence, source Ensemble).
/// 2. Merged pairs and unmatched detections that overlap (IoU >= match threshold, transitively)
///    form clusters. A cluster holding both detectors' output with more than one class is a
///    class conflict: each class scores the sum of confidence x detector weight of its members
///    (a merged pair counts both contributors); ties go to a class the primary reported.
///    Winning-class members keep their own box and confidence and are tagged Ensemble; the
///    other classes in the cluster are dropped.
/// 3. Singletons outside any conflict survive only with confidence > single_detector_min_confidence.
/// 4. Class-scoped NMS, then confidence >= min_final_confidence, sorted descending.
///
/// Stateless apart from the immutable config; safe to call from several threads.
class EnsembleAggregator {
 public:
  /// \p config is expected to have passed EnsembleConfig::validate().
  explicit EnsembleAggregator(EnsembleConfig config);

  [[nodiscard]] AggregationOutcome aggregate(std::span<const Detection> primary,
                                             std::span<const Detection> secondary) const;

  [[nodiscard]] const EnsembleConfig& config() const noexcept { return config_; }

 private:
  EnsembleConfig config_;
};

}  // namespace aeroinspect::core
