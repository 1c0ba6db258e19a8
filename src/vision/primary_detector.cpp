#include <aeroinspect/vision/primary_detector.hpp>
#include "frame_cv_utils.hpp"
#include <aeroinspect/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <exception>
#include <optional>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;

/// BGR8 letterbox -> Float32RGB in [0,1], the layout the backends expect.
std::optional<ac::Frame> to_model_tensor(const ac::Frame& model_input) {
  auto view = detail::frame_to_mat(model_input);
  if (!view || model_input.format() != ac::PixelFormat::BGR8) return std::nullopt;
  cv::Mat rgb;
  cv::cvtColor(*view, rgb, cv::COLOR_BGR2RGB);
  cv::Mat scaled;
  rgb.convertTo(scaled, CV_32FC3, 1.0 / 255.0);
  return detail::mat_to_frame(scaled, ac::PixelFormat::Float32RGB);
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

PrimaryDetector::PrimaryDetector(std::shared_ptr<ModelHandle> model, DefectDecoder decoder)
    : model_(std::move(model)), decoder_(decoder) {}

ac::DetectionSet PrimaryDetector::detect(const PreprocessedImage& image) {
  const auto start = std::chrono::steady_clock::now();

  auto backend = model_->get();
  if (!backend) {
    ac::logger()->warn("primary detector unavailable: {}", ac::to_string(backend.error()));
    return ac::DetectionSet::failure(backend.error(), elapsed_ms(start));
  }

  if (auto fits = check_model_input_size(**backend, image.model_input.width()); !fits) {
    ac::logger()->error("primary detector cannot run: {}", fits.error());
    return ac::DetectionSet::failure(ac::PipelineError::DetectorUnavailable, elapsed_ms(start));
  }

  try {
    auto tensor = to_model_tensor(image.model_input);
    if (!tensor) {
      ac::logger()->error("primary detector got an unusable model input");
      return ac::DetectionSet::failure(ac::PipelineError::InferenceFailed, elapsed_ms(start));
    }
    auto raw = (*backend)->infer(*tensor);
    if (!raw) {
      ac::logger()->warn("primary inference failed: {}", ac::to_string(raw.error()));
      return ac::DetectionSet::failure(raw.error(), elapsed_ms(start));
    }

    ac::DetectionSet out;
    out.detections = decoder_.decode(*raw, image.letterbox, image.width(), image.height());
    out.latency_ms = elapsed_ms(start);
    ac::logger()->debug("primary detector: {} raw -> {} detections in {:.1f} ms",
                        raw->num_detections, out.detections.size(), out.latency_ms);
    return out;
  } catch (const std::exception& e) {
    ac::logger()->error("primary detector crashed: {}", e.what());
    return ac::DetectionSet::failure(ac::PipelineError::InferenceFailed, elapsed_ms(start));
  }
}

}  // namespace aeroinspect::vision
