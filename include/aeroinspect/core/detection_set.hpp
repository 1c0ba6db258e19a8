#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <optional>
#include <vector>

namespace aeroinspect::core {

/// Output of one detector adapter for one job. A set with error() carries no usable detections.
struct DetectionSet {
  std::vector<Detection> detections;
  double latency_ms{0.0};
  std::optional<PipelineError> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  [[nodiscard]] static DetectionSet failure(PipelineError e, double latency_ms = 0.0) {
    DetectionSet s;
    s.latency_ms = latency_ms;
    s.error = e;
    return s;
  }
};

}  // namespace aeroinspect::core
