#include <aeroinspect/vision/secondary_detector.hpp>
#include "base64.hpp"
#include "frame_cv_utils.hpp"
#include <aeroinspect/core/log.hpp>
#include <aeroinspect/vision/vision_response_parser.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <vector>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;
using nlohmann::json;

std::string class_list() {
  std::string out;
  for (const auto c : ac::all_defect_classes()) {
    if (!out.empty()) out += ", ";
    out += ac::to_string(c);
  }
  return out;
}

std::string detection_prompt(std::uint32_t width, std::uint32_t height,
                             std::span<const ac::Detection> candidates) {
  std::string prompt = fmt::format(
      "You are an expert aircraft maintenance inspector analyzing images for defects.\n\n"
      "Analyze this aircraft image ({}x{} pixels) and identify any defects from the following "
      "categories:\n{}\n\n"
      "For each defect you detect:\n"
      "1. Identify the defect type (must be one of the categories above)\n"
      "2. Estimate the confidence level (0.0 to 1.0)\n"
      "3. Provide the bounding box in pixel coordinates of this image (x, y, width, height)\n\n"
      "Return your response as a JSON array with this exact format:\n"
      "[\n  {{\n    \"class\": \"defect_type\",\n    \"confidence\": 0.85,\n"
      "    \"bbox\": {{\"x\": 100, \"y\": 150, \"width\": 50, \"height\": 60}},\n"
      "    \"description\": \"Brief description of the defect\"\n  }}\n]\n\n"
      "If no defects are found, return an empty array: []\n\n"
      "Important:\n"
      "- Only detect defects from the specified categories\n"
      "- Be conservative with confidence scores\n"
      "- Provide accurate bounding box coordinates\n"
      "- Focus on visible structural defects, not normal aircraft features",
      width, height, class_list());

  if (!candidates.empty()) {
    prompt += "\n\nA local detector flagged these regions; confirm, correct or reject them:\n";
    for (const auto& c : candidates) {
      prompt += fmt::format("- {} ({:.2f}) at x={:.0f} y={:.0f} width={:.0f} height={:.0f}\n",
                            ac::to_string(c.defect_class), c.confidence, c.bbox.x, c.bbox.y,
                            c.bbox.width, c.bbox.height);
    }
  }
  return prompt;
}

std::string jpeg_data_url(const ac::Frame& image, int quality) {
  auto view = detail::frame_to_mat(image);
  if (!view) {
    throw std::invalid_argument("image has no pixel data");
  }
  std::vector<std::uint8_t> jpeg;
  if (!cv::imencode(".jpg", *view, jpeg, {cv::IMWRITE_JPEG_QUALITY, quality})) {
    throw std::runtime_error("JPEG encoding failed");
  }
  return "data:image/jpeg;base64," + detail::base64_encode(jpeg);
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock lock(m);
  // wait_for returns the predicate: true means stop was requested before the delay ran out.
  return !cv.wait_for(lock, stop, delay, [&stop] { return stop.stop_requested(); });
}

std::string build_vision_request(const SecondaryConfig& config, const PreprocessedImage& image,
                                 std::span<const ac::Detection> candidates) {
  json text_part = json::object();
  text_part["type"] = "text";
  text_part["text"] = detection_prompt(image.width(), image.height(), candidates);

  json image_part = json::object();
  image_part["type"] = "image_url";
  image_part["image_url"]["url"] = jpeg_data_url(image.normalized, config.jpeg_quality);

  json content = json::array();
  content.push_back(std::move(text_part));
  content.push_back(std::move(image_part));

  json message = json::object();
  message["role"] = "user";
  message["content"] = std::move(content);

  json request = json::object();
  request["model"] = config.model;
  request["messages"] = json::array({std::move(message)});
  request["max_tokens"] = config.max_tokens;
  request["temperature"] = 0.1;
  return request.dump();
}

SecondaryDetector::SecondaryDetector(std::shared_ptr<IVisionTransport> transport,
                                     SecondaryConfig config,
                                     RetryPolicy policy,
                                     Sleeper sleeper)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      policy_(policy),
      sleeper_(std::move(sleeper)),
      rng_(std::random_device{}()) {
  ac::logger()->info("secondary detector: endpoint={} model={} attempts={} timeout={}ms",
                     config_.endpoint.empty() ? "<none>" : config_.endpoint, config_.model,
                     policy_.max_attempts, config_.per_call_timeout.count());
}

std::chrono::milliseconds SecondaryDetector::next_delay(std::uint32_t attempt) {
  std::lock_guard lock(rng_mutex_);
  return policy_.delay_before_retry(attempt, &rng_);
}

AttemptResult SecondaryDetector::attempt(const std::string& body, const PreprocessedImage& image) {
  auto response = transport_->post(body, config_.per_call_timeout);
  if (!response) {
    return std::unexpected(AttemptFailure{response.error(), true, std::string(ac::to_string(response.error()))});
  }
  if (response->status < 200 || response->status > 299) {
    return std::unexpected(classify_http_status(response->status));
  }

  const std::string text = unwrap_chat_completion(response->body);
  auto parsed = parse_vision_response(text, image.width(), image.height());
  if (!parsed) {
    return std::unexpected(AttemptFailure{parsed.error(), true, "unparseable response"});
  }
  return std::move(parsed->detections);
}

ac::DetectionSet SecondaryDetector::detect(const PreprocessedImage& image,
                                           std::span<const ac::Detection> candidates,
                                           std::stop_token stop) {
  const auto start = std::chrono::steady_clock::now();
  if (config_.endpoint.empty() || !transport_) {
    ac::logger()->debug("secondary detector not configured");
    return ac::DetectionSet::failure(ac::PipelineError::DetectorUnavailable, elapsed_ms(start));
  }

  std::string body;
  try {
    body = build_vision_request(config_, image, candidates);
  } catch (const std::exception& e) {
    ac::logger()->error("cannot build remote request: {}", e.what());
    return ac::DetectionSet::failure(ac::PipelineError::InferenceFailed, elapsed_ms(start));
  }

  ac::PipelineError last_error = ac::PipelineError::DetectorUnavailable;
  for (std::uint32_t n = 1;; ++n) {
    if (stop.stop_requested()) {
      return ac::DetectionSet::failure(ac::PipelineError::Timeout, elapsed_ms(start));
    }

    auto result = attempt(body, image);
    if (result) {
      ac::DetectionSet out;
      out.detections = std::move(*result);
      out.latency_ms = elapsed_ms(start);
      ac::logger()->debug("secondary detector: {} detections after {} attempt(s) in {:.1f} ms",
                          out.detections.size(), n, out.latency_ms);
      return out;
    }

    last_error = result.error().error;
    ac::logger()->warn("secondary attempt {}/{} failed: {}", n, policy_.max_attempts,
                       result.error().detail);
    if (!policy_.should_retry(result.error(), n)) {
      break;
    }
    const auto delay = next_delay(n);
    if (!sleeper_(delay, stop)) {
      return ac::DetectionSet::failure(ac::PipelineError::Timeout, elapsed_ms(start));
    }
  }
  return ac::DetectionSet::failure(last_error, elapsed_ms(start));
}

}  // namespace aeroinspect::vision
