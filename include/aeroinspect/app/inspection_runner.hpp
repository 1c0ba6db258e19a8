#pragma once

#include <aeroinspect/app/inspection_service.hpp>
#include <aeroinspect/core/ensemble_result.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace aeroinspect::app {

using InspectionOutcome =
    std::expected<aeroinspect::core::EnsembleResult, aeroinspect::core::PipelineError>;

/// Callback for each image's outcome, with its index in the batch; may be invoked from worker
/// threads. Must be thread-safe if using run_inspection_batch_parallel.
using InspectionCallback = std::function<void(std::size_t index, const InspectionOutcome&)>;

/// Submits images one after another; calls callback for each outcome, in order.
void run_inspection_batch(InspectionService& service,
                          const std::vector<aeroinspect::core::Frame>& images,
                          const InspectionCallback& callback);

/// Submits images from a pool of worker threads. The service's governor still bounds how
/// many run at once; extra workers queue on it in FIFO order.
/// num_workers 0 = use hardware concurrency.
void run_inspection_batch_parallel(InspectionService& service,
                                   const std::vector<aeroinspect::core::Frame>& images,
                                   const InspectionCallback& callback,
                                   std::size_t num_workers = 0);

}  // namespace aeroinspect::app
