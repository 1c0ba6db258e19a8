#pragma once

#include <aeroinspect/core/defect.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aeroinspect::core {

/// Final, confidence-ranked defect list for one inspected image.
/// An empty detections list means no defects were found.
/// degraded is set when only one detector contributed; warnings explain why.
struct EnsembleResult {
  std::vector<Detection> detections;
  double processing_time_ms{0.0};
  bool degraded{false};
  std::vector<std::string> warnings;

  double quality_score{0.0};
  std::size_t primary_count{0};
  std::size_t secondary_count{0};
  std::uint32_t image_width{0};
  std::uint32_t image_height{0};
};

}  // namespace aeroinspect::core
