#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/detection_set.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <span>
#include <stop_token>

namespace aeroinspect::vision {

/// Local, in-process detector. detect() never throws for model failures; they come back as
/// DetectionSet::error. Must be safe to call from several jobs at once.
class IPrimaryDetector {
 public:
  virtual ~IPrimaryDetector() = default;

  [[nodiscard]] virtual aeroinspect::core::DetectionSet detect(const PreprocessedImage& image) = 0;
};

/// Remote detector. \p candidates are optional region hints; \p stop asks an in-progress
/// call to give up between attempts (the coordinator no longer waits for it).
class ISecondaryDetector {
 public:
  virtual ~ISecondaryDetector() = default;

  [[nodiscard]] virtual aeroinspect::core::DetectionSet detect(
      const PreprocessedImage& image,
      std::span<const aeroinspect::core::Detection> candidates,
      std::stop_token stop) = 0;
};

}  // namespace aeroinspect::vision
