#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/core/log.hpp>
#include <fmt/format.h>
#include <atomic>
#include <exception>
#include <future>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace aeroinspect::app {

namespace {

namespace ac = aeroinspect::core;
namespace av = aeroinspect::vision;
using Clock = std::chrono::steady_clock;

void transition(ac::InspectionJob& job, ac::JobState next, const JobObserver* observer) {
  ac::logger()->debug("job {}: {} -> {}", job.id, ac::to_string(job.state), ac::to_string(next));
  job.state = next;
  if (observer != nullptr && *observer) {
    (*observer)(job.id, next);
  }
}

double elapsed_ms(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

/// Starts \p fn on a detached thread unless \p live already counts \p cap branch threads.
/// The thread owns everything it touches, so the job may stop waiting for it at any time.
/// It leaves the count before publishing its result.
template <typename Fn>
std::optional<std::future<ac::DetectionSet>> launch_branch(
    Fn fn, const std::shared_ptr<std::atomic<std::size_t>>& live, std::size_t cap) {
  if (live->fetch_add(1) >= cap) {
    live->fetch_sub(1);
    return std::nullopt;
  }
  std::promise<ac::DetectionSet> promise;
  auto future = promise.get_future();
  std::thread([fn = std::move(fn), promise = std::move(promise), live]() mutable {
    std::optional<ac::DetectionSet> result;
    std::exception_ptr error;
    try {
      result = fn();
    } catch (...) {
      error = std::current_exception();
    }
    live->fetch_sub(1);
    if (error) {
      promise.set_exception(error);
    } else {
      promise.set_value(std::move(*result));
    }
  }).detach();
  return future;
}

ac::DetectionSet collect(std::optional<std::future<ac::DetectionSet>>& branch_future,
                         const ac::InspectionJob& job, const char* branch, Clock::time_point start) {
  if (!branch_future) {
    ac::logger()->warn("job {}: {} detector not started, too many detector threads still running",
                       job.id, branch);
    return ac::DetectionSet::failure(ac::PipelineError::DetectorUnavailable, elapsed_ms(start));
  }
  auto& future = *branch_future;
  if (future.wait_until(job.deadline) != std::future_status::ready) {
    ac::logger()->warn("job {}: {} detector missed the deadline, abandoning it", job.id, branch);
    return ac::DetectionSet::failure(ac::PipelineError::Timeout, elapsed_ms(start));
  }
  try {
    return future.get();
  } catch (const std::exception& e) {
    ac::logger()->error("job {}: {} detector threw: {}", job.id, branch, e.what());
    return ac::DetectionSet::failure(ac::PipelineError::InferenceFailed, elapsed_ms(start));
  }
}

}  // namespace

InferenceCoordinator::InferenceCoordinator(std::shared_ptr<const av::ImagePreprocessor> preprocessor,
                                           std::shared_ptr<av::IPrimaryDetector> primary,
                                           std::shared_ptr<av::ISecondaryDetector> secondary,
                                           ac::EnsembleConfig ensemble_config,
                                           CoordinatorConfig config)
    : preprocessor_(std::move(preprocessor)),
      primary_(std::move(primary)),
      secondary_(std::move(secondary)),
      aggregator_(ensemble_config),
      config_(config),
      live_branches_(std::make_shared<std::atomic<std::size_t>>(0)) {}

std::size_t InferenceCoordinator::detector_threads() const noexcept {
  return live_branches_->load();
}

std::expected<ac::EnsembleResult, ac::PipelineError> InferenceCoordinator::run(
    ac::InspectionJob& job, const ac::Frame& image, const JobObserver* observer) const {
  return run_job(job, [&] { return preprocessor_->preprocess(image); }, observer);
}

std::expected<ac::EnsembleResult, ac::PipelineError> InferenceCoordinator::run_encoded(
    ac::InspectionJob& job, std::span<const std::byte> encoded, const JobObserver* observer) const {
  return run_job(job, [&] { return preprocessor_->preprocess_encoded(encoded); }, observer);
}

std::expected<ac::EnsembleResult, ac::PipelineError> InferenceCoordinator::run_job(
    ac::InspectionJob& job, const PreprocessFn& preprocess, const JobObserver* observer) const {
  const auto start = Clock::now();
  job.deadline = start + config_.job_deadline;
  transition(job, ac::JobState::Preprocessing, observer);

  auto preprocessed = preprocess();
  if (!preprocessed) {
    ac::logger()->warn("job {} rejected: {}", job.id, ac::to_string(preprocessed.error()));
    job.failure = preprocessed.error();
    transition(job, ac::JobState::Failed, observer);
    return std::unexpected(preprocessed.error());
  }
  auto image = std::make_shared<const av::PreprocessedImage>(std::move(*preprocessed));

  transition(job, ac::JobState::Detecting, observer);
  std::stop_source stop;
  const auto cap = config_.max_detector_threads;
  auto primary_future = launch_branch(
      [detector = primary_, image] { return detector->detect(*image); }, live_branches_, cap);
  auto secondary_future = launch_branch(
      [detector = secondary_, image, token = stop.get_token()] {
        return detector->detect(*image, {}, token);
      },
      live_branches_, cap);

  job.primary_result = collect(primary_future, job, "primary", start);
  job.secondary_result = collect(secondary_future, job, "secondary", start);
  // Anything still retrying is no longer awaited.
  stop.request_stop();

  const bool primary_ok = job.primary_result->ok();
  const bool secondary_ok = job.secondary_result->ok();
  if (!primary_ok && !secondary_ok) {
    ac::logger()->error("job {} failed: primary {}, secondary {}", job.id,
                        ac::to_string(*job.primary_result->error),
                        ac::to_string(*job.secondary_result->error));
    job.failure = ac::PipelineError::AllBackendsUnavailable;
    transition(job, ac::JobState::Failed, observer);
    return std::unexpected(ac::PipelineError::AllBackendsUnavailable);
  }

  transition(job, ac::JobState::Aggregating, observer);
  ac::EnsembleResult result;
  result.warnings = image->warnings;
  if (!primary_ok) {
    result.degraded = true;
    result.warnings.push_back(fmt::format("primary detector {}; results from secondary detector only",
                                          ac::to_string(*job.primary_result->error)));
  }
  if (!secondary_ok) {
    result.degraded = true;
    result.warnings.push_back(fmt::format("secondary detector {}; results from primary detector only",
                                          ac::to_string(*job.secondary_result->error)));
  }

  const auto& primary_detections = job.primary_result->detections;
  const auto& secondary_detections = job.secondary_result->detections;
  auto outcome = aggregator_.aggregate(primary_detections, secondary_detections);
  for (auto& w : outcome.warnings) {
    result.warnings.push_back(std::move(w));
  }

  result.detections = std::move(outcome.detections);
  result.quality_score = image->quality_score;
  result.primary_count = primary_detections.size();
  result.secondary_count = secondary_detections.size();
  result.image_width = image->width();
  result.image_height = image->height();
  result.processing_time_ms = elapsed_ms(start);

  if (result.processing_time_ms > static_cast<double>(config_.latency_target.count())) {
    ac::logger()->warn("job {} took {:.0f} ms (target {} ms)", job.id, result.processing_time_ms,
                       config_.latency_target.count());
  }
  ac::logger()->info("job {} completed: {} defect(s){} in {:.0f} ms", job.id,
                     result.detections.size(), result.degraded ? " (degraded)" : "",
                     result.processing_time_ms);
  transition(job, ac::JobState::Completed, observer);
  return result;
}

}  // namespace aeroinspect::app
