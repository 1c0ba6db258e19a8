#pragma once

#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace aeroinspect::vision {

struct ParsedVisionResponse {
  std::vector<aeroinspect::core::Detection> detections;  // source Secondary, clamped to the image
  std::size_t rejected{0};                               // records dropped individually
};

/// Returns choices[0].message.content when \p body is an OpenAI chat-completion envelope,
/// otherwise \p body unchanged.
[[nodiscard]] std::string unwrap_chat_completion(std::string_view body);

/// Tolerant parser for the remote model's answer.
///
/// Accepts a bare JSON array, an object with a "defects" array, or either of those wrapped
/// in ``` fences or surrounding prose (the text between the first '[' and the last ']' is
/// tried). Each record {class, confidence, bbox:{x,y,width,height}, description?} is
/// validated on its own: unknown classes, missing fields and boxes with no area inside the
/// image are dropped and counted; confidences are clamped to [0, 1].
///
/// Errors: MalformedResponse when nothing JSON-shaped can be recovered.
[[nodiscard]] std::expected<ParsedVisionResponse, aeroinspect::core::PipelineError>
parse_vision_response(std::string_view text, std::uint32_t image_width, std::uint32_t image_height);

}  // namespace aeroinspect::vision
