#pragma once

#include <string_view>

namespace aeroinspect::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidImage,          // undecodable or empty image buffer
  DimensionsOutOfRange,  // image smaller/larger than the accepted range
  DetectorUnavailable,   // model weights missing, endpoint unreachable or not configured
  InferenceFailed,       // model crashed or rejected its input
  Timeout,               // per-call or job deadline exceeded
  MalformedResponse,     // remote model answered with nothing parseable
  InvalidConfig,
  AllBackendsUnavailable,
};

[[nodiscard]] std::string_view to_string(PipelineError e) noexcept;

/// External error code reported to callers: "INVALID_IMAGE", "ALL_BACKENDS_UNAVAILABLE", ...
[[nodiscard]] std::string_view error_code(PipelineError e) noexcept;

/// True for errors caused by the submitted image rather than by a backend.
[[nodiscard]] constexpr bool is_input_error(PipelineError e) noexcept {
  return e == PipelineError::InvalidImage || e == PipelineError::DimensionsOutOfRange;
}

}  // namespace aeroinspect::core
