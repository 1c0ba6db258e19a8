/**
 * aeroinspect-cli: inspect aircraft image(s) for surface defects; output JSON results.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/aeroinspect_cli [--config path] [--input path ...]
 * With --input: also writes each result to output/<basename>.json (same content as terminal).
 */

#include <aeroinspect/app/config.hpp>
#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/app/inspection_runner.hpp>
#include <aeroinspect/app/inspection_service.hpp>
#include <aeroinspect/app/result_json.hpp>
#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/core/log.hpp>
#include <aeroinspect/vision/defect_decoder.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <aeroinspect/vision/load_image.hpp>
#include <aeroinspect/vision/mock_inference_backend.hpp>
#include <aeroinspect/vision/model_handle.hpp>
#include <aeroinspect/vision/onnx_inference_backend.hpp>
#include <aeroinspect/vision/primary_detector.hpp>
#include <aeroinspect/vision/secondary_detector.hpp>
#include <aeroinspect/vision/vision_transport.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::unique_ptr<aeroinspect::app::InspectionService> build_service(
    const aeroinspect::app::AppConfig& cfg) {
  using namespace aeroinspect::core;
  using namespace aeroinspect::vision;

  auto preprocessor = std::make_shared<const ImagePreprocessor>(cfg.preprocessor);

  BackendFactory factory;
  if (cfg.backend_type == aeroinspect::app::InferenceBackendType::Onnx) {
    factory = [path = cfg.model_path]() -> std::unique_ptr<IInferenceBackend> {
      return std::make_unique<OnnxInferenceBackend>(path);
    };
  } else {
    factory = []() -> std::unique_ptr<IInferenceBackend> {
      auto mock = std::make_unique<MockInferenceBackend>();
      // Model-input pixels of the 640x640 letterbox.
      mock->set_detections({
          {DefectClass::Crack, 0.9f, {200.f, 220.f, 60.f, 80.f}, DetectionSource::Primary, std::nullopt},
      });
      return mock;
    };
  }
  auto model = std::make_shared<ModelHandle>(std::move(factory));
  if (cfg.backend_type == aeroinspect::app::InferenceBackendType::Onnx) {
    // Load now so a model built for another input size stops startup.
    if (auto backend = model->get()) {
      if (auto fits = check_model_input_size(**backend, cfg.preprocessor.model_input_size); !fits) {
        throw std::invalid_argument(fits.error());
      }
    } else {
      logger()->warn("onnx model {} unavailable; running with the remote detector only",
                     cfg.model_path);
    }
  }
  auto primary = std::make_shared<PrimaryDetector>(
      model, DefectDecoder(cfg.detection_threshold, cfg.model_nms_threshold));

  auto transport = std::make_shared<CurlVisionTransport>(cfg.secondary.endpoint, cfg.secondary.api_key);
  auto secondary = std::make_shared<SecondaryDetector>(transport, cfg.secondary, cfg.retry);

  auto coordinator_config = cfg.coordinator;
  coordinator_config.max_detector_threads = 2 * cfg.max_concurrent_jobs;
  auto coordinator = std::make_shared<const aeroinspect::app::InferenceCoordinator>(
      preprocessor, primary, secondary, cfg.ensemble, coordinator_config);
  return std::make_unique<aeroinspect::app::InspectionService>(coordinator, cfg.max_concurrent_jobs);
}

/// Mid-gray gradient with some texture, large enough to pass the dimension check.
aeroinspect::core::Frame make_demo_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(static_cast<std::size_t>(w) * h * 3);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const auto v = static_cast<std::uint8_t>(96 + (x * 64) / w + ((x / 8 + y / 8) % 2) * 24);
      const std::size_t i = (static_cast<std::size_t>(y) * w + x) * 3;
      buffer[i + 0] = std::byte{v};
      buffer[i + 1] = std::byte{v};
      buffer[i + 2] = std::byte{v};
    }
  }
  return aeroinspect::core::Frame(w, h, aeroinspect::core::PixelFormat::BGR8, std::move(buffer));
}

std::string outcome_text(const aeroinspect::app::InspectionOutcome& outcome) {
  if (!outcome) {
    return aeroinspect::app::error_to_json(outcome.error()).dump(2);
  }
  return aeroinspect::app::result_to_json(*outcome).dump(2);
}

void write_output(const std::string& input_path, const std::string& text) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".json");
  std::ofstream f(out_file);
  if (f) {
    f << text << "\n";
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string endpoint_override;
  std::size_t workers = 1;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--endpoint" && i + 1 < argc) {
      endpoint_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "Invalid --workers " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: aeroinspect_cli [options] [--input <path> ...]\n"
                << "  --config <path>     Config (key=value file); default: built-in (mock, no remote)\n"
                << "  --backend <type>    Override backend: mock | onnx (default from config)\n"
                << "  --model <path>      Override model path (required for --backend onnx)\n"
                << "  --endpoint <url>    Override remote vision endpoint (chat completions URL)\n"
                << "  --workers <n>       Submit several inputs in parallel (default 1)\n"
                << "  --input <path>      Image path, repeatable (optional; demo uses synthetic image)\n"
                << "\nEnvironment: AEROINSPECT_<KEY> overrides any config key; OPENAI_API_KEY sets the API key.\n";
      return 0;
    }
  }

  aeroinspect::app::AppConfig cfg;
  try {
    cfg = config_path.empty() ? aeroinspect::app::default_config()
                              : aeroinspect::app::load_config(config_path);
    aeroinspect::app::apply_env_overrides(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Config error: " << e.what() << "\n";
    return 2;
  }

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = aeroinspect::app::InferenceBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = aeroinspect::app::InferenceBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!endpoint_override.empty()) cfg.secondary.endpoint = endpoint_override;

  if (auto valid = aeroinspect::app::validate_config(cfg); !valid) {
    std::cerr << aeroinspect::app::error_to_json(aeroinspect::core::PipelineError::InvalidConfig).dump()
              << "\nConfig error: " << valid.error() << "\n";
    return 2;
  }
  aeroinspect::core::set_log_level(cfg.log_level);

  std::unique_ptr<aeroinspect::app::InspectionService> service;
  try {
    service = build_service(cfg);
  } catch (const std::invalid_argument& e) {
    std::cerr << aeroinspect::app::error_to_json(aeroinspect::core::PipelineError::InvalidConfig).dump()
              << "\nConfig error: " << e.what() << "\n";
    return 2;
  }

  if (input_paths.empty()) {
    auto outcome = service->submit(make_demo_frame(1024, 768));
    std::cout << outcome_text(outcome) << "\n";
    return outcome ? 0 : 1;
  }

  std::vector<aeroinspect::core::Frame> frames;
  frames.reserve(input_paths.size());
  for (const auto& path : input_paths) {
    auto loaded = aeroinspect::vision::load_frame_from_image(path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << path << "\n";
      return 1;
    }
    frames.push_back(std::move(*loaded));
  }

  std::mutex print_mutex;
  bool any_failed = false;
  aeroinspect::app::run_inspection_batch_parallel(
      *service, frames,
      [&](std::size_t index, const aeroinspect::app::InspectionOutcome& outcome) {
        const std::string text = outcome_text(outcome);
        std::lock_guard lock(print_mutex);
        if (!outcome) any_failed = true;
        std::cout << input_paths[index] << ":\n" << text << "\n";
        write_output(input_paths[index], text);
      },
      workers);
  return any_failed ? 1 : 0;
}
