#include <aeroinspect/vision/vision_response_parser.hpp>
#include <aeroinspect/core/geometry.hpp>
#include <aeroinspect/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <optional>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;
using nlohmann::json;

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

/// Text between the first ``` marker (minus its language tag) and the next one, if fenced.
/// The fence may sit on one line with its content.
std::optional<std::string_view> fenced_body(std::string_view s) {
  const auto open = s.find("```");
  if (open == std::string_view::npos) return std::nullopt;
  std::size_t begin = open + 3;
  while (begin < s.size() && (std::isalnum(static_cast<unsigned char>(s[begin])) != 0 ||
                              s[begin] == '_' || s[begin] == '-')) {
    ++begin;
  }
  const auto close = s.find("```", begin);
  const auto end = close == std::string_view::npos ? s.size() : close;
  return trim(s.substr(begin, end - begin));
}

/// End (one past) of the bracketed value opening at \p open, skipping brackets in strings.
std::size_t balanced_end(std::string_view s, std::size_t open) {
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open; i < s.size(); ++i) {
    const char c = s[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '[') {
      ++depth;
    } else if (c == ']' && --depth == 0) {
      return i + 1;
    }
  }
  return std::string_view::npos;
}

std::optional<json> parse_quiet(std::string_view text) {
  json parsed = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) return std::nullopt;
  return parsed;
}

/// The array of records, if \p j is one or wraps one under "defects".
std::optional<json> records_of(const json& j) {
  if (j.is_array()) return j;
  if (j.is_object()) {
    const auto it = j.find("defects");
    if (it != j.end() && it->is_array()) return *it;
  }
  return std::nullopt;
}

/// First array of objects (or empty array) found in \p text: the whole text, else any
/// balanced [...] span, scanned left to right.
std::optional<json> find_records(std::string_view text) {
  if (auto whole = parse_quiet(text)) {
    if (auto records = records_of(*whole)) return records;
  }
  for (auto open = text.find('['); open != std::string_view::npos;
       open = text.find('[', open + 1)) {
    const auto end = balanced_end(text, open);
    if (end == std::string_view::npos) continue;
    auto sliced = parse_quiet(text.substr(open, end - open));
    if (!sliced || !sliced->is_array()) continue;
    const bool all_objects = std::all_of(sliced->begin(), sliced->end(),
                                         [](const json& e) { return e.is_object(); });
    if (all_objects) return sliced;
  }
  return std::nullopt;
}

std::optional<float> number_field(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return std::nullopt;
  return it->get<float>();
}

std::optional<ac::Detection> to_detection(const json& record, std::uint32_t width,
                                          std::uint32_t height) {
  if (!record.is_object()) return std::nullopt;

  const auto cls = record.find("class");
  if (cls == record.end() || !cls->is_string()) return std::nullopt;
  const auto defect_class = ac::defect_class_from_string(cls->get<std::string>());
  if (!defect_class) {
    ac::logger()->warn("dropping remote detection with unknown class '{}'",
                       cls->get<std::string>());
    return std::nullopt;
  }

  const auto confidence = number_field(record, "confidence");
  if (!confidence) return std::nullopt;

  const auto box = record.find("bbox");
  if (box == record.end() || !box->is_object()) return std::nullopt;
  const auto x = number_field(*box, "x");
  const auto y = number_field(*box, "y");
  const auto w = number_field(*box, "width");
  const auto h = number_field(*box, "height");
  if (!x || !y || !w || !h) return std::nullopt;

  const auto clamped = ac::clamp_to_image(ac::BBox{*x, *y, *w, *h}, width, height);
  if (!clamped) return std::nullopt;

  ac::Detection d;
  d.defect_class = *defect_class;
  d.confidence = std::clamp(*confidence, 0.f, 1.f);
  d.bbox = *clamped;
  d.source = ac::DetectionSource::Secondary;
  const auto description = record.find("description");
  if (description != record.end() && description->is_string()) {
    d.description = description->get<std::string>();
  }
  return d;
}

}  // namespace

std::string unwrap_chat_completion(std::string_view body) {
  const auto parsed = parse_quiet(body);
  if (parsed && parsed->is_object()) {
    const auto choices = parsed->find("choices");
    if (choices != parsed->end() && choices->is_array() && !choices->empty()) {
      const json& first = (*choices)[0];
      if (first.is_object() && first.contains("message") && first["message"].is_object()) {
        const json& message = first["message"];
        const auto content = message.find("content");
        if (content != message.end() && content->is_string()) {
          return content->get<std::string>();
        }
      }
    }
  }
  return std::string(body);
}

std::expected<ParsedVisionResponse, ac::PipelineError> parse_vision_response(
    std::string_view text, std::uint32_t image_width, std::uint32_t image_height) {
  const std::string_view body = trim(text);
  if (body.empty()) {
    return std::unexpected(ac::PipelineError::MalformedResponse);
  }

  std::optional<json> records;
  if (const auto fenced = fenced_body(body); fenced && !fenced->empty()) {
    records = find_records(*fenced);
  }
  if (!records) {
    records = find_records(body);
  }
  if (!records) {
    ac::logger()->warn("remote response holds no JSON detection array ({} chars)", body.size());
    return std::unexpected(ac::PipelineError::MalformedResponse);
  }

  ParsedVisionResponse out;
  for (const auto& record : *records) {
    if (auto d = to_detection(record, image_width, image_height)) {
      out.detections.push_back(std::move(*d));
    } else {
      ++out.rejected;
    }
  }
  if (out.rejected > 0) {
    ac::logger()->warn("dropped {} invalid remote detection record(s)", out.rejected);
  }
  return out;
}

}  // namespace aeroinspect::vision
