#include <aeroinspect/core/inspection_job.hpp>

namespace aeroinspect::core {

std::string_view to_string(JobState s) noexcept {
  switch (s) {
    case JobState::Queued:
      return "queued";
    case JobState::Preprocessing:
      return "preprocessing";
    case JobState::Detecting:
      return "detecting";
    case JobState::Aggregating:
      return "aggregating";
    case JobState::Completed:
      return "completed";
    case JobState::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

}  // namespace aeroinspect::core
