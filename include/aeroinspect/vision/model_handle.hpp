#pragma once

#include <aeroinspect/core/error.hpp>
#include <aeroinspect/vision/inference_backend.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace aeroinspect::vision {

using BackendFactory = std::function<std::unique_ptr<IInferenceBackend>()>;

/// Lazily constructed, shared, read-only inference backend.
///
/// The first get() runs the factory (and warmup) exactly once, even when several jobs race
/// to it; the others block until it finishes. A factory that throws or returns null leaves the
/// handle permanently unavailable: every get() then reports DetectorUnavailable.
class ModelHandle {
 public:
  explicit ModelHandle(BackendFactory factory);

  /// Wraps an already constructed backend (tests, warm start).
  explicit ModelHandle(std::unique_ptr<IInferenceBackend> backend);

  ModelHandle(const ModelHandle&) = delete;
  ModelHandle& operator=(const ModelHandle&) = delete;

  [[nodiscard]] std::expected<const IInferenceBackend*, aeroinspect::core::PipelineError> get();

  [[nodiscard]] bool initialized() const noexcept { return initialized_.load(); }

 private:
  void initialize();

  BackendFactory factory_;
  std::once_flag once_;
  std::unique_ptr<IInferenceBackend> backend_;
  std::atomic<bool> initialized_{false};
};

/// Checks that \p backend takes the square letterbox the preprocessor produces.
/// Backends that do not report an input size pass. The error names both sizes.
[[nodiscard]] std::expected<void, std::string> check_model_input_size(
    const IInferenceBackend& backend, std::uint32_t letterbox_side);

}  // namespace aeroinspect::vision
