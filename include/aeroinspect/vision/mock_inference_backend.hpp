#pragma once

#include <aeroinspect/vision/inference_backend.hpp>
#include <aeroinspect/core/defect.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace aeroinspect::vision {

/// Mock backend that returns configurable synthetic detections (for tests/demo).
/// Boxes given to set_detections are in model-input pixels.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Set detections to return on subsequent infer() calls.
  void set_detections(std::vector<aeroinspect::core::Detection> detections);

  /// Make subsequent infer() calls fail with \p error (nullopt clears the failure).
  void set_failure(std::optional<aeroinspect::core::PipelineError> error);

  /// Declare the model input size; validate_input then rejects other sizes (nullopt: any size).
  void set_input_size(std::optional<ModelInputSize> size);

  [[nodiscard]] std::optional<ModelInputSize> input_size() const noexcept override;

  [[nodiscard]] std::expected<InferenceResult, aeroinspect::core::PipelineError>
  infer(const aeroinspect::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, aeroinspect::core::PipelineError>
  validate_input(const aeroinspect::core::Frame& input) const override;

  [[nodiscard]] std::size_t invocations() const noexcept { return invocations_.load(); }

 private:
  mutable std::mutex mutex_;
  std::vector<aeroinspect::core::Detection> detections_to_return_;
  std::optional<aeroinspect::core::PipelineError> failure_;
  std::optional<ModelInputSize> input_size_;
  mutable std::atomic<std::size_t> invocations_{0};
};

}  // namespace aeroinspect::vision
