#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <random>
#include <string>
#include <vector>

namespace aeroinspect::vision {

/// Why one remote attempt failed and whether trying again can help.
struct AttemptFailure {
  aeroinspect::core::PipelineError error{aeroinspect::core::PipelineError::DetectorUnavailable};
  bool transient{true};
  std::string detail;
};

/// Outcome of a single remote attempt.
using AttemptResult = std::expected<std::vector<aeroinspect::core::Detection>, AttemptFailure>;

/// Exponential backoff: the delay before retry n (1-based) is base_delay * 2^(n-1), capped at
/// max_delay. With jitter the delay is drawn uniformly from [d/2, d].
struct RetryPolicy {
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{8000};
  bool jitter{false};

  /// Delay to wait after failed attempt number \p attempt (1-based). \p rng is used only with jitter.
  [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::uint32_t attempt,
                                                             std::mt19937* rng = nullptr) const;

  /// True when \p failure is transient and fewer than max_attempts have been made.
  [[nodiscard]] bool should_retry(const AttemptFailure& failure,
                                  std::uint32_t attempts_made) const noexcept;
};

/// Maps an HTTP status to a failure: 429 and 5xx are transient, other non-2xx are final.
[[nodiscard]] AttemptFailure classify_http_status(long status);

}  // namespace aeroinspect::vision
