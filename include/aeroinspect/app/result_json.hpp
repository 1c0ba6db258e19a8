#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/ensemble_result.hpp>
#include <aeroinspect/core/error.hpp>
#include <nlohmann/json.hpp>

namespace aeroinspect::app {

/// {class, confidence, bbox:{x,y,width,height}, source[, description]}
[[nodiscard]] nlohmann::json detection_to_json(const aeroinspect::core::Detection& d);

/// {defects, processingTimeMs, degraded, warnings, qualityScore,
///  metadata:{primaryDetections, secondaryDetections, finalDetections, imageWidth, imageHeight}}
[[nodiscard]] nlohmann::json result_to_json(const aeroinspect::core::EnsembleResult& result);

/// {error:{code, message}} with code INVALID_IMAGE, ALL_BACKENDS_UNAVAILABLE, INVALID_CONFIG, ...
[[nodiscard]] nlohmann::json error_to_json(aeroinspect::core::PipelineError error);

}  // namespace aeroinspect::app
