#pragma once

#include <aeroinspect/core/error.hpp>
#include <chrono>
#include <expected>
#include <string>

namespace aeroinspect::vision {

struct HttpResponse {
  long status{0};
  std::string body;
};

/// Sends one JSON request to the remote vision model. Transport-level failures only:
/// any HTTP status (including 4xx/5xx) is a successful call returning that status.
/// Errors: Timeout when the per-call timeout elapses, DetectorUnavailable for connection errors.
class IVisionTransport {
 public:
  virtual ~IVisionTransport() = default;

  [[nodiscard]] virtual std::expected<HttpResponse, aeroinspect::core::PipelineError>
  post(const std::string& json_body, std::chrono::milliseconds timeout) = 0;
};

/// libcurl transport: HTTPS POST with a bearer token. A fresh easy handle per call,
/// so one instance can serve concurrent jobs.
class CurlVisionTransport : public IVisionTransport {
 public:
  CurlVisionTransport(std::string endpoint, std::string api_key);

  [[nodiscard]] std::expected<HttpResponse, aeroinspect::core::PipelineError>
  post(const std::string& json_body, std::chrono::milliseconds timeout) override;

  [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

 private:
  std::string endpoint_;
  std::string api_key_;
};

}  // namespace aeroinspect::vision
