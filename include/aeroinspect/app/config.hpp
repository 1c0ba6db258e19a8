#pragma once

#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/core/ensemble_config.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <aeroinspect/vision/retry_policy.hpp>
#include <aeroinspect/vision/secondary_detector.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace aeroinspect::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Process-wide configuration, loaded once at startup.
struct AppConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  float detection_threshold{0.5f};
  float model_nms_threshold{0.45f};

  aeroinspect::vision::PreprocessorConfig preprocessor;
  aeroinspect::core::EnsembleConfig ensemble;
  aeroinspect::vision::SecondaryConfig secondary;
  aeroinspect::vision::RetryPolicy retry;
  CoordinatorConfig coordinator;

  std::size_t max_concurrent_jobs{5};
  std::string log_level{"info"};
};

/// Default config when no file is provided.
AppConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments) over the defaults.
/// A missing file yields the defaults. Unknown keys are logged and ignored; a malformed
/// value throws std::invalid_argument naming the key.
AppConfig load_config(const std::string& path);

/// Applies AEROINSPECT_<KEY> environment variables (e.g. AEROINSPECT_PRIMARY_WEIGHT) and
/// takes the remote API key from OPENAI_API_KEY. Throws std::invalid_argument like load_config.
void apply_env_overrides(AppConfig& config);

/// Checks ensemble weights/thresholds and the remaining ranges. The error names the field.
[[nodiscard]] std::expected<void, std::string> validate_config(const AppConfig& config);

}  // namespace aeroinspect::app
