#include <aeroinspect/vision/retry_policy.hpp>
#include <algorithm>
#include <cstdint>
#include <string>

namespace aeroinspect::vision {

namespace ac = aeroinspect::core;

std::chrono::milliseconds RetryPolicy::delay_before_retry(std::uint32_t attempt,
                                                          std::mt19937* rng) const {
  if (attempt == 0) attempt = 1;
  // Doubling past 2^20 is far above any sane cap; stop shifting there.
  const std::uint32_t shift = std::min<std::uint32_t>(attempt - 1, 20);
  const auto base = base_delay.count() < 0 ? 0 : base_delay.count();
  const auto uncapped = base * (std::int64_t{1} << shift);
  const auto capped = std::min<std::int64_t>(uncapped, std::max<std::int64_t>(max_delay.count(), 0));

  if (!jitter || rng == nullptr || capped == 0) {
    return std::chrono::milliseconds(capped);
  }
  std::uniform_int_distribution<std::int64_t> dist(capped / 2, capped);
  return std::chrono::milliseconds(dist(*rng));
}

bool RetryPolicy::should_retry(const AttemptFailure& failure,
                               std::uint32_t attempts_made) const noexcept {
  return failure.transient && attempts_made < max_attempts;
}

AttemptFailure classify_http_status(long status) {
  AttemptFailure f;
  f.error = ac::PipelineError::DetectorUnavailable;
  f.detail = "HTTP " + std::to_string(status);
  // Auth failures and bad requests cannot change on a repeat.
  f.transient = status == 429 || (status >= 500 && status <= 599);
  return f;
}

}  // namespace aeroinspect::vision
