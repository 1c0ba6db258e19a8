#include <aeroinspect/vision/model_handle.hpp>
#include <aeroinspect/core/log.hpp>
#include <exception>
#include <fmt/format.h>

namespace aeroinspect::vision {

namespace ac = aeroinspect::core;

ModelHandle::ModelHandle(BackendFactory factory) : factory_(std::move(factory)) {}

ModelHandle::ModelHandle(std::unique_ptr<IInferenceBackend> backend) {
  // Adopt the backend now; call_once still runs but finds nothing to build.
  backend_ = std::move(backend);
}

void ModelHandle::initialize() {
  initialized_ = true;
  if (backend_ || !factory_) {
    if (!backend_) ac::logger()->error("model handle has no backend factory");
    return;
  }
  try {
    auto backend = factory_();
    if (!backend) {
      ac::logger()->error("model backend factory returned nothing");
      return;
    }
    backend->warmup();
    backend_ = std::move(backend);
    ac::logger()->info("primary model initialized");
  } catch (const std::exception& e) {
    ac::logger()->error("primary model initialization failed: {}", e.what());
  }
}

std::expected<const IInferenceBackend*, ac::PipelineError> ModelHandle::get() {
  std::call_once(once_, [this] { initialize(); });
  if (!backend_) {
    return std::unexpected(ac::PipelineError::DetectorUnavailable);
  }
  return backend_.get();
}

std::expected<void, std::string> check_model_input_size(const IInferenceBackend& backend,
                                                        std::uint32_t letterbox_side) {
  const auto size = backend.input_size();
  if (!size || (size->width == letterbox_side && size->height == letterbox_side)) {
    return {};
  }
  return std::unexpected(fmt::format("model expects {}x{} input but the preprocessor letterboxes to {}x{}",
                                     size->width, size->height, letterbox_side, letterbox_side));
}

}  // namespace aeroinspect::vision
