#include <aeroinspect/core/error.hpp>

namespace aeroinspect::core {

std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "none";
    case PipelineError::InvalidImage:
      return "image could not be decoded";
    case PipelineError::DimensionsOutOfRange:
      return "image dimensions out of range";
    case PipelineError::DetectorUnavailable:
      return "detector unavailable";
    case PipelineError::InferenceFailed:
      return "inference failed";
    case PipelineError::Timeout:
      return "timed out";
    case PipelineError::MalformedResponse:
      return "malformed detector response";
    case PipelineError::InvalidConfig:
      return "invalid configuration";
    case PipelineError::AllBackendsUnavailable:
      return "all inference backends unavailable";
    default:
      return "unknown error";
  }
}

std::string_view error_code(PipelineError e) noexcept {
  if (is_input_error(e)) return "INVALID_IMAGE";
  switch (e) {
    case PipelineError::None:
      return "NONE";
    case PipelineError::InvalidConfig:
      return "INVALID_CONFIG";
    case PipelineError::AllBackendsUnavailable:
    case PipelineError::DetectorUnavailable:
    case PipelineError::InferenceFailed:
    case PipelineError::Timeout:
    case PipelineError::MalformedResponse:
      return "ALL_BACKENDS_UNAVAILABLE";
    default:
      return "INTERNAL_ERROR";
  }
}

}  // namespace aeroinspect::core
