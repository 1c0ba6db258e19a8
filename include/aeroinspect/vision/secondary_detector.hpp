#pragma once

#include <aeroinspect/vision/detector.hpp>
#include <aeroinspect/vision/retry_policy.hpp>
#include <aeroinspect/vision/vision_transport.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <span>
#include <stop_token>
#include <string>

namespace aeroinspect::vision {

struct SecondaryConfig {
  std::string endpoint;  // empty: remote detector not configured
  std::string model{"gpt-4o"};
  std::string api_key;
  std::chrono::milliseconds per_call_timeout{20000};
  std::uint32_t max_tokens{1000};
  int jpeg_quality{90};
};

/// Waits \p delay unless \p stop is requested first. Returns false when interrupted.
using Sleeper = std::function<bool(std::chrono::milliseconds delay, std::stop_token stop)>;

/// Interruptible sleep on a condition variable; the default Sleeper.
[[nodiscard]] bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop);

/// Builds the chat-completion request body (prompt, optional candidate hints, JPEG data URL).
/// Throws cv::Exception if the image cannot be encoded.
[[nodiscard]] std::string build_vision_request(const SecondaryConfig& config,
                                               const PreprocessedImage& image,
                                               std::span<const aeroinspect::core::Detection> candidates);

/// Remote vision-language detector adapter.
///
/// Each attempt posts the request through the transport and parses the answer. Transport
/// errors, HTTP 429/5xx and malformed answers are retried per RetryPolicy; other HTTP errors
/// end the call at once. After the last attempt the DetectionSet carries the last error.
/// A stop request is honoured between attempts and during backoff (error Timeout).
class SecondaryDetector : public ISecondaryDetector {
 public:
  SecondaryDetector(std::shared_ptr<IVisionTransport> transport,
                    SecondaryConfig config,
                    RetryPolicy policy = {},
                    Sleeper sleeper = interruptible_sleep);

  [[nodiscard]] aeroinspect::core::DetectionSet detect(
      const PreprocessedImage& image,
      std::span<const aeroinspect::core::Detection> candidates,
      std::stop_token stop) override;

  [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

 private:
  [[nodiscard]] AttemptResult attempt(const std::string& body, const PreprocessedImage& image);
  [[nodiscard]] std::chrono::milliseconds next_delay(std::uint32_t attempt);

  std::shared_ptr<IVisionTransport> transport_;
  SecondaryConfig config_;
  RetryPolicy policy_;
  Sleeper sleeper_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace aeroinspect::vision
