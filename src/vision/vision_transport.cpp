#include <aeroinspect/vision/vision_transport.hpp>
#include <aeroinspect/core/log.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;

std::size_t write_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

struct CurlDeleter {
  void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};

struct SlistDeleter {
  void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

}  // namespace

CurlVisionTransport::CurlVisionTransport(std::string endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {
  ensure_curl_global_init();
}

std::expected<HttpResponse, ac::PipelineError> CurlVisionTransport::post(
    const std::string& json_body, std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    ac::logger()->error("curl_easy_init failed");
    return std::unexpected(ac::PipelineError::DetectorUnavailable);
  }

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  if (!api_key_.empty()) {
    const std::string auth = "Authorization: Bearer " + api_key_;
    raw_headers = curl_slist_append(raw_headers, auth.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(json_body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  const CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    ac::logger()->warn("vision endpoint timed out after {} ms", timeout.count());
    return std::unexpected(ac::PipelineError::Timeout);
  }
  if (res != CURLE_OK) {
    ac::logger()->warn("vision endpoint unreachable: {}", curl_easy_strerror(res));
    return std::unexpected(ac::PipelineError::DetectorUnavailable);
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

}  // namespace aeroinspect::vision
