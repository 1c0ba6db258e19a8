#pragma once

#include <aeroinspect/core/ensemble_aggregator.hpp>
#include <aeroinspect/core/ensemble_config.hpp>
#include <aeroinspect/core/ensemble_result.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/core/inspection_job.hpp>
#include <aeroinspect/vision/detector.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>

namespace aeroinspect::app {

struct CoordinatorConfig {
  std::chrono::milliseconds job_deadline{30000};    // stop waiting for detectors after this
  std::chrono::milliseconds latency_target{10000};  // slower jobs log a performance warning
  /// Detector threads (running or abandoned at a deadline) allowed at once, across all jobs.
  /// A branch that would exceed it fails as DetectorUnavailable. Twice the job limit by default.
  std::size_t max_detector_threads{10};
};

/// Notified on every job state change, from the thread running the job. Must be thread-safe
/// when the coordinator is shared.
using JobObserver = std::function<void(std::uint64_t job_id, aeroinspect::core::JobState state)>;

/// Drives one InspectionJob through Preprocessing -> Detecting -> Aggregating -> Completed|Failed.
///
/// Preprocessing failures fail the job before any detector runs. Both detectors then run
/// concurrently on their own threads under the job deadline (set when preprocessing starts);
/// a branch still running at the deadline is abandoned and its late result discarded.
/// One failed branch gives a degraded result; two give AllBackendsUnavailable.
/// An abandoned branch keeps its thread until the detector returns, counted against
/// CoordinatorConfig::max_detector_threads so hung detectors cannot pile up threads.
class InferenceCoordinator {
 public:
  InferenceCoordinator(std::shared_ptr<const aeroinspect::vision::ImagePreprocessor> preprocessor,
                       std::shared_ptr<aeroinspect::vision::IPrimaryDetector> primary,
                       std::shared_ptr<aeroinspect::vision::ISecondaryDetector> secondary,
                       aeroinspect::core::EnsembleConfig ensemble_config,
                       CoordinatorConfig config = {});

  /// Inspects a decoded image.
  [[nodiscard]] std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>
  run(aeroinspect::core::InspectionJob& job,
      const aeroinspect::core::Frame& image,
      const JobObserver* observer = nullptr) const;

  /// Inspects encoded image bytes (JPEG, PNG, ...).
  [[nodiscard]] std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>
  run_encoded(aeroinspect::core::InspectionJob& job,
              std::span<const std::byte> encoded,
              const JobObserver* observer = nullptr) const;

  [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }

  /// Detector threads started and not yet returned, including abandoned ones.
  [[nodiscard]] std::size_t detector_threads() const noexcept;

 private:
  using PreprocessFn = std::function<std::expected<aeroinspect::vision::PreprocessedImage,
                                                   aeroinspect::core::PipelineError>()>;

  [[nodiscard]] std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>
  run_job(aeroinspect::core::InspectionJob& job,
          const PreprocessFn& preprocess,
          const JobObserver* observer) const;

  std::shared_ptr<const aeroinspect::vision::ImagePreprocessor> preprocessor_;
  std::shared_ptr<aeroinspect::vision::IPrimaryDetector> primary_;
  std::shared_ptr<aeroinspect::vision::ISecondaryDetector> secondary_;
  aeroinspect::core::EnsembleAggregator aggregator_;
  CoordinatorConfig config_;
  std::shared_ptr<std::atomic<std::size_t>> live_branches_;
};

}  // namespace aeroinspect::app
