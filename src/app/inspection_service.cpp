#include <aeroinspect/app/inspection_service.hpp>
#include <aeroinspect/core/log.hpp>
#include <chrono>

namespace aeroinspect::app {

namespace ac = aeroinspect::core;

InspectionService::InspectionService(std::shared_ptr<const InferenceCoordinator> coordinator,
                                     std::size_t max_concurrent_jobs,
                                     JobObserver observer)
    : coordinator_(std::move(coordinator)),
      governor_(max_concurrent_jobs),
      observer_(std::move(observer)) {
  ac::logger()->info("inspection service: max {} concurrent job(s)", governor_.limit());
}

ac::InspectionJob InspectionService::open_job() {
  ac::InspectionJob job;
  job.id = next_job_id_.fetch_add(1);
  job.state = ac::JobState::Queued;
  job.submitted_at = ac::InspectionJob::Clock::now();
  ac::logger()->debug("job {} queued ({} waiting)", job.id, governor_.waiting());
  if (observer_) observer_(job.id, ac::JobState::Queued);
  return job;
}

std::expected<ac::EnsembleResult, ac::PipelineError> InspectionService::submit(
    const ac::Frame& image) {
  auto job = open_job();
  const auto permit = governor_.acquire();
  return coordinator_->run(job, image, &observer_);
}

std::expected<ac::EnsembleResult, ac::PipelineError> InspectionService::submit_encoded(
    std::span<const std::byte> encoded) {
  auto job = open_job();
  const auto permit = governor_.acquire();
  return coordinator_->run_encoded(job, encoded, &observer_);
}

}  // namespace aeroinspect::app
