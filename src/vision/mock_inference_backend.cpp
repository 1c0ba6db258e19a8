#include <aeroinspect/vision/mock_inference_backend.hpp>
#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <cstdint>
#include <vector>

namespace aeroinspect::vision {

namespace ac = aeroinspect::core;

void MockInferenceBackend::set_detections(std::vector<ac::Detection> detections) {
  std::lock_guard lock(mutex_);
  detections_to_return_ = std::move(detections);
}

void MockInferenceBackend::set_failure(std::optional<ac::PipelineError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

void MockInferenceBackend::set_input_size(std::optional<ModelInputSize> size) {
  std::lock_guard lock(mutex_);
  input_size_ = size;
}

std::optional<ModelInputSize> MockInferenceBackend::input_size() const noexcept {
  std::lock_guard lock(mutex_);
  return input_size_;
}

static InferenceResult mock_to_result(const std::vector<ac::Detection>& detections) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  for (const auto& d : detections) {
    r.boxes.push_back(d.bbox.x);
    r.boxes.push_back(d.bbox.y);
    r.boxes.push_back(d.bbox.right());
    r.boxes.push_back(d.bbox.bottom());
    r.scores.push_back(d.confidence);
    r.class_ids.push_back(static_cast<std::int64_t>(static_cast<std::uint8_t>(d.defect_class)));
  }
  return r;
}

std::expected<InferenceResult, ac::PipelineError>
MockInferenceBackend::infer(const ac::Frame& input) const {
  ++invocations_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  std::lock_guard lock(mutex_);
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return mock_to_result(detections_to_return_);
}

std::expected<void, ac::PipelineError>
MockInferenceBackend::validate_input(const ac::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(ac::PipelineError::InvalidImage);
  }
  const auto size = input_size();
  if (size && (input.width() != size->width || input.height() != size->height)) {
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }
  return {};
}

}  // namespace aeroinspect::vision
