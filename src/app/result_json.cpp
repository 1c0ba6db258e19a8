#include <aeroinspect/app/result_json.hpp>
#include <string>

namespace aeroinspect::app {

namespace ac = aeroinspect::core;
using nlohmann::json;

json detection_to_json(const ac::Detection& d) {
  json out = {
      {"class", std::string(ac::to_string(d.defect_class))},
      {"confidence", d.confidence},
      {"bbox", {{"x", d.bbox.x}, {"y", d.bbox.y}, {"width", d.bbox.width}, {"height", d.bbox.height}}},
      {"source", std::string(ac::to_string(d.source))},
  };
  if (d.description) {
    out["description"] = *d.description;
  }
  return out;
}

json result_to_json(const ac::EnsembleResult& result) {
  json defects = json::array();
  for (const auto& d : result.detections) {
    defects.push_back(detection_to_json(d));
  }
  json out;
  out["defects"] = std::move(defects);
  out["processingTimeMs"] = result.processing_time_ms;
  out["degraded"] = result.degraded;
  out["warnings"] = result.warnings;
  out["qualityScore"] = result.quality_score;
  out["metadata"] = {
      {"primaryDetections", result.primary_count},
      {"secondaryDetections", result.secondary_count},
      {"finalDetections", result.detections.size()},
      {"imageWidth", result.image_width},
      {"imageHeight", result.image_height},
  };
  return out;
}

json error_to_json(ac::PipelineError error) {
  json out;
  out["error"] = {
      {"code", std::string(ac::error_code(error))},
      {"message", std::string(ac::to_string(error))},
  };
  return out;
}

}  // namespace aeroinspect::app
