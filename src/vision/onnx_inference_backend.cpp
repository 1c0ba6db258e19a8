#include <aeroinspect/vision/onnx_inference_backend.hpp>
#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/core/log.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;

constexpr int64_t kNumChannels = 3;
constexpr int64_t kEndToEndAttrs = 6;  // xmin, ymin, xmax, ymax, score, class_id

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      const std::size_t dst_idx = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst_idx] = hwc[src_idx + 0];
      nchw[1 * hw + dst_idx] = hwc[src_idx + 1];
      nchw[2 * hw + dst_idx] = hwc[src_idx + 2];
    }
  }
}

/// Reads attribute \p a of candidate \p i from a [1, A, N] (attr-major) or [1, N, A] tensor.
struct OutputView {
  const float* data{nullptr};
  int64_t num_candidates{0};
  int64_t num_attrs{0};
  bool attr_major{true};

  [[nodiscard]] float at(int64_t i, int64_t a) const noexcept {
    return attr_major ? data[a * num_candidates + i] : data[i * num_attrs + a];
  }
};

/// Candidates always outnumber attributes in detection heads (8400 vs 16 for YOLOv8 at 640),
/// which tells the two orientations apart.
std::optional<OutputView> make_view(const std::vector<int64_t>& shape, const float* data) {
  if (shape.size() != 3u || shape[0] != 1 || shape[1] <= 0 || shape[2] <= 0) {
    return std::nullopt;
  }
  OutputView v;
  v.data = data;
  if (shape[1] == kEndToEndAttrs || (shape[1] < shape[2] && shape[2] != kEndToEndAttrs)) {
    v.attr_major = true;
    v.num_attrs = shape[1];
    v.num_candidates = shape[2];
  } else {
    v.attr_major = false;
    v.num_attrs = shape[2];
    v.num_candidates = shape[1];
  }
  if (v.num_attrs < 5) return std::nullopt;
  return v;
}

void decode_end_to_end(const OutputView& v, float score_floor, InferenceResult& result) {
  for (int64_t i = 0; i < v.num_candidates; ++i) {
    const float score = v.at(i, 4);
    if (score < score_floor) continue;
    result.boxes.push_back(v.at(i, 0));
    result.boxes.push_back(v.at(i, 1));
    result.boxes.push_back(v.at(i, 2));
    result.boxes.push_back(v.at(i, 3));
    result.scores.push_back(score);
    result.class_ids.push_back(static_cast<int64_t>(v.at(i, 5)));
  }
}

void decode_yolov8(const OutputView& v, float score_floor, InferenceResult& result) {
  const int64_t num_classes = v.num_attrs - 4;
  for (int64_t i = 0; i < v.num_candidates; ++i) {
    int64_t best_class = 0;
    float best_score = v.at(i, 4);
    for (int64_t c = 1; c < num_classes; ++c) {
      const float s = v.at(i, 4 + c);
      if (s > best_score) {
        best_score = s;
        best_class = c;
      }
    }
    if (best_score < score_floor) continue;
    const float cx = v.at(i, 0);
    const float cy = v.at(i, 1);
    const float half_w = v.at(i, 2) / 2.f;
    const float half_h = v.at(i, 3) / 2.f;
    result.boxes.push_back(cx - half_w);
    result.boxes.push_back(cy - half_h);
    result.boxes.push_back(cx + half_w);
    result.boxes.push_back(cy + half_h);
    result.scores.push_back(best_score);
    result.class_ids.push_back(best_class);
  }
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "aeroinspect"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  float score_floor{0.05f};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::string input_name,
                                           float score_floor)
    : impl_(std::make_unique<Impl>()) {
  impl_->score_floor = score_floor;
  try {
    impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);
  } catch (const Ort::Exception& e) {
    throw std::runtime_error("OnnxInferenceBackend: cannot load " + model_path + ": " + e.what());
  }

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  if (input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    impl_->input_name = std::move(input_name);
  }

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[2] <= 0 || dims[3] <= 0 || dims[1] <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: dynamic input dimensions are not supported");
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  ac::logger()->info("onnx model loaded: {} input={}x{} ({})", model_path, impl_->input_width,
                     impl_->input_height, impl_->input_is_nchw ? "NCHW" : "NHWC");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::optional<ModelInputSize> OnnxInferenceBackend::input_size() const noexcept {
  return ModelInputSize{impl_->input_width, impl_->input_height};
}

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<void, ac::PipelineError>
OnnxInferenceBackend::validate_input(const ac::Frame& input) const {
  if (input.empty() || input.format() != ac::PixelFormat::Float32RGB) {
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }
  if (!input.is_consistent()) {
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }
  return {};
}

std::expected<InferenceResult, ac::PipelineError>
OnnxInferenceBackend::infer(const ac::Frame& input) const {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  std::vector<float> nchw_buffer;

  if (impl_->input_is_nchw) {
    nchw_buffer.resize(num_floats);
    HwcToNchw(src, h, w, nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, nchw_buffer.data(), num_floats,
                                                   shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, const_cast<float*>(src), num_floats,
                                                   shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1, output_names_c, 1);
  } catch (const Ort::Exception& e) {
    ac::logger()->error("onnx inference failed: {}", e.what());
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }

  const auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  auto view = make_view(shape, outputs[0].GetTensorData<float>());
  if (!view) {
    ac::logger()->error("unsupported onnx output shape (rank {})", shape.size());
    return std::unexpected(ac::PipelineError::InferenceFailed);
  }

  InferenceResult result;
  if (view->num_attrs == kEndToEndAttrs) {
    decode_end_to_end(*view, impl_->score_floor, result);
  } else {
    decode_yolov8(*view, impl_->score_floor, result);
  }
  result.num_detections = static_cast<std::uint32_t>(result.scores.size());
  return result;
}

void OnnxInferenceBackend::warmup() {
  const std::size_t num_bytes =
      static_cast<std::size_t>(impl_->input_height) * impl_->input_width * kNumChannels * sizeof(float);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  ac::Frame frame(impl_->input_width, impl_->input_height, ac::PixelFormat::Float32RGB,
                  std::move(buffer));
  if (auto r = infer(frame); !r) {
    ac::logger()->warn("onnx warmup failed: {}", ac::to_string(r.error()));
  }
}

}  // namespace aeroinspect::vision
