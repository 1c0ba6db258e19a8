#pragma once

#include <aeroinspect/app/inspection_runner.hpp>
#include <aeroinspect/app/inspection_service.hpp>
#include <aeroinspect/core/frame.hpp>
#include <vector>

#ifdef AEROINSPECT_HAS_TBB

namespace aeroinspect::app {

/// Submits a batch of images from TBB tasks.
///
/// Each image goes through service.submit(), so the governor limit and FIFO admission still
/// apply; TBB only supplies the submitting threads. Jobs block on detectors and the network,
/// so the arena is capped at the service's concurrency limit to keep TBB workers from
/// piling up behind the governor.
/// \param callback Invoked once per image with (index, outcome). Must be thread-safe.
void run_inspection_batch_tbb(InspectionService& service,
                              const std::vector<aeroinspect::core::Frame>& images,
                              const InspectionCallback& callback);

}  // namespace aeroinspect::app

#endif  // AEROINSPECT_HAS_TBB
