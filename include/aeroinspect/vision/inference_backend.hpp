#pragma once

#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace aeroinspect::vision {

/// Spatial size of the model's input tensor.
struct ModelInputSize {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Abstract inference backend: model-input Frame -> InferenceResult.
/// Implementations are read-only after construction: infer() may be called from several
/// jobs at once.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-frame inference. Input is a Float32RGB frame of the model input size.
  [[nodiscard]] virtual std::expected<InferenceResult, aeroinspect::core::PipelineError>
  infer(const aeroinspect::core::Frame& input) const = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, aeroinspect::core::PipelineError>
  validate_input(const aeroinspect::core::Frame& /*input*/) const {
    return {};
  }

  /// Input size the model was built for, when the backend knows it. Default: unknown.
  [[nodiscard]] virtual std::optional<ModelInputSize> input_size() const noexcept {
    return std::nullopt;
  }

  /// Optional: warmup run (e.g. dummy inference). Called once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace aeroinspect::vision
