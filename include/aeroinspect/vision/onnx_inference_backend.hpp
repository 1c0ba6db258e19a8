#pragma once

#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/vision/inference_backend.hpp>
#include <aeroinspect/vision/inference_result.hpp>
#include <memory>
#include <optional>
#include <string>

namespace aeroinspect::vision {

/// ONNX Runtime inference backend for the local defect model.
///
/// Expected model: one float image input, [1,3,H,W] or [1,H,W,3], and one output in either
/// - **YOLOv8 raw layout**: [1, 4+C, N] (or [1, N, 4+C]) with (cx, cy, w, h, score_0..score_{C-1})
///   per candidate; the class is the argmax of the C scores, or
/// - **End-to-end layout**: [1, N, 6] (or [1, 6, N]) with (xmin, ymin, xmax, ymax, score, class_id).
///
/// Output boxes are corner coordinates in model-input pixels. Candidates scoring below
/// \p score_floor are dropped here to keep the result small; the decoder applies the real threshold.
///
/// Input contract: Float32RGB HWC frame, values in [0,1], matching the model input size.
/// infer() keeps its scratch buffers local, so one backend can serve concurrent jobs.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file. Throws std::runtime_error if it cannot be loaded.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  explicit OnnxInferenceBackend(std::string model_path,
                                std::string input_name = {},
                                float score_floor = 0.05f);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, aeroinspect::core::PipelineError>
  infer(const aeroinspect::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, aeroinspect::core::PipelineError>
  validate_input(const aeroinspect::core::Frame& input) const override;

  void warmup() override;

  [[nodiscard]] std::optional<ModelInputSize> input_size() const noexcept override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace aeroinspect::vision
