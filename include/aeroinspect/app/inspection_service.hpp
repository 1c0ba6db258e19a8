#pragma once

#include <aeroinspect/app/concurrency_governor.hpp>
#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/core/ensemble_result.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>

namespace aeroinspect::app {

/// Entry point for inspections: synchronous for the caller, concurrent internally.
///
/// Every submission becomes an InspectionJob with a fresh id, is reported Queued, then waits
/// for a ConcurrencyGovernor slot (FIFO) before the coordinator runs it. The slot is held
/// until the job has reached Completed or Failed. Safe to call from many threads.
class InspectionService {
 public:
  InspectionService(std::shared_ptr<const InferenceCoordinator> coordinator,
                    std::size_t max_concurrent_jobs = 5,
                    JobObserver observer = {});

  [[nodiscard]] std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>
  submit(const aeroinspect::core::Frame& image);

  [[nodiscard]] std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>
  submit_encoded(std::span<const std::byte> encoded);

  [[nodiscard]] const ConcurrencyGovernor& governor() const noexcept { return governor_; }

 private:
  [[nodiscard]] aeroinspect::core::InspectionJob open_job();

  std::shared_ptr<const InferenceCoordinator> coordinator_;
  ConcurrencyGovernor governor_;
  JobObserver observer_;
  std::atomic<std::uint64_t> next_job_id_{1};
};

}  // namespace aeroinspect::app
