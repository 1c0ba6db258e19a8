#pragma once

#include <aeroinspect/core/detection_set.hpp>
#include <aeroinspect/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace aeroinspect::core {

/// Lifecycle of one inspection: Queued -> Preprocessing -> Detecting -> Aggregating -> Completed,
/// with Failed reachable from Preprocessing and Detecting.
enum class JobState : std::uint8_t {
  Queued,
  Preprocessing,
  Detecting,
  Aggregating,
  Completed,
  Failed,
};

[[nodiscard]] std::string_view to_string(JobState s) noexcept;

[[nodiscard]] constexpr bool is_terminal(JobState s) noexcept {
  return s == JobState::Completed || s == JobState::Failed;
}

/// Transient per-submission state. Lives only while the coordinator runs the job.
struct InspectionJob {
  using Clock = std::chrono::steady_clock;

  std::uint64_t id{0};
  JobState state{JobState::Queued};
  Clock::time_point submitted_at{};
  Clock::time_point deadline{};
  std::optional<DetectionSet> primary_result;
  std::optional<DetectionSet> secondary_result;
  std::optional<PipelineError> failure;
};

}  // namespace aeroinspect::core
