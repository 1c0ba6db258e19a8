#pragma once

#include <aeroinspect/vision/defect_decoder.hpp>
#include <aeroinspect/vision/detector.hpp>
#include <aeroinspect/vision/model_handle.hpp>
#include <memory>

namespace aeroinspect::vision {

/// Runs the local model on the letterboxed model input and decodes its output into
/// canonical detections (image pixels, clamped, thresholded, NMS'd, sorted).
///
/// The model input is converted BGR8 -> Float32RGB scaled to [0,1] per call.
/// Model initialization failures, inference failures and exceptions all come back as a
/// DetectionSet carrying an error and the elapsed time.
class PrimaryDetector : public IPrimaryDetector {
 public:
  PrimaryDetector(std::shared_ptr<ModelHandle> model, DefectDecoder decoder);

  [[nodiscard]] aeroinspect::core::DetectionSet detect(const PreprocessedImage& image) override;

 private:
  std::shared_ptr<ModelHandle> model_;
  DefectDecoder decoder_;
};

}  // namespace aeroinspect::vision
