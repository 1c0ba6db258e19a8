#include <aeroinspect/app/config.hpp>
#include <aeroinspect/core/log.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace aeroinspect::app {

namespace {

constexpr std::array<std::string_view, 25> kKeys = {
    "model_path",
    "backend_type",
    "model_input_size",
    "detection_threshold",
    "model_nms_threshold",
    "min_dimension",
    "max_dimension",
    "quality_floor",
    "primary_weight",
    "secondary_weight",
    "match_iou_threshold",
    "nms_iou_threshold",
    "single_detector_min_confidence",
    "min_final_confidence",
    "secondary_endpoint",
    "secondary_model",
    "secondary_timeout_ms",
    "secondary_max_attempts",
    "secondary_base_delay_ms",
    "secondary_max_delay_ms",
    "secondary_jitter",
    "max_concurrent_jobs",
    "job_deadline_ms",
    "latency_target_ms",
    "log_level",
};

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

[[noreturn]] void bad_value(std::string_view key, const std::string& value) {
  throw std::invalid_argument("invalid value for " + std::string(key) + ": '" + value + "'");
}

float to_float(std::string_view key, const std::string& value) {
  try {
    std::size_t used = 0;
    const float f = std::stof(value, &used);
    if (used != value.size()) bad_value(key, value);
    return f;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

unsigned long to_unsigned(std::string_view key, const std::string& value) {
  if (value.empty() || value[0] == '-') bad_value(key, value);
  try {
    std::size_t used = 0;
    const unsigned long n = std::stoul(value, &used);
    if (used != value.size()) bad_value(key, value);
    return n;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

bool to_bool(std::string_view key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  bad_value(key, value);
}

std::chrono::milliseconds to_ms(std::string_view key, const std::string& value) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(to_unsigned(key, value)));
}

/// Returns false for unknown keys.
bool apply_setting(AppConfig& c, std::string_view key, const std::string& value) {
  if (key == "model_path") c.model_path = value;
  else if (key == "backend_type") {
    if (value == "onnx") c.backend_type = InferenceBackendType::Onnx;
    else if (value == "mock") c.backend_type = InferenceBackendType::Mock;
    else bad_value(key, value);
  }
  else if (key == "model_input_size") c.preprocessor.model_input_size = static_cast<std::uint32_t>(to_unsigned(key, value));
  else if (key == "detection_threshold") c.detection_threshold = to_float(key, value);
  else if (key == "model_nms_threshold") c.model_nms_threshold = to_float(key, value);
  else if (key == "min_dimension") c.preprocessor.min_dimension = static_cast<std::uint32_t>(to_unsigned(key, value));
  else if (key == "max_dimension") c.preprocessor.max_dimension = static_cast<std::uint32_t>(to_unsigned(key, value));
  else if (key == "quality_floor") c.preprocessor.quality_floor = to_float(key, value);
  else if (key == "primary_weight") c.ensemble.primary_weight = to_float(key, value);
  else if (key == "secondary_weight") c.ensemble.secondary_weight = to_float(key, value);
  else if (key == "match_iou_threshold") c.ensemble.match_iou_threshold = to_float(key, value);
  else if (key == "nms_iou_threshold") c.ensemble.nms_iou_threshold = to_float(key, value);
  else if (key == "single_detector_min_confidence") c.ensemble.single_detector_min_confidence = to_float(key, value);
  else if (key == "min_final_confidence") c.ensemble.min_final_confidence = to_float(key, value);
  else if (key == "secondary_endpoint") c.secondary.endpoint = value;
  else if (key == "secondary_model") c.secondary.model = value;
  else if (key == "secondary_timeout_ms") c.secondary.per_call_timeout = to_ms(key, value);
  else if (key == "secondary_max_attempts") c.retry.max_attempts = static_cast<std::uint32_t>(to_unsigned(key, value));
  else if (key == "secondary_base_delay_ms") c.retry.base_delay = to_ms(key, value);
  else if (key == "secondary_max_delay_ms") c.retry.max_delay = to_ms(key, value);
  else if (key == "secondary_jitter") c.retry.jitter = to_bool(key, value);
  else if (key == "max_concurrent_jobs") c.max_concurrent_jobs = static_cast<std::size_t>(to_unsigned(key, value));
  else if (key == "job_deadline_ms") c.coordinator.job_deadline = to_ms(key, value);
  else if (key == "latency_target_ms") c.coordinator.latency_target = to_ms(key, value);
  else if (key == "log_level") c.log_level = value;
  else return false;
  return true;
}

bool in_unit_range(float v) { return v >= 0.f && v <= 1.f; }

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.model_path = "";
  c.backend_type = InferenceBackendType::Mock;
  c.detection_threshold = 0.5f;
  c.model_nms_threshold = 0.45f;
  c.secondary.endpoint = "";
  c.secondary.model = "gpt-4o";
  c.max_concurrent_jobs = 5;
  c.log_level = "info";
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    aeroinspect::core::logger()->warn("config file {} not readable, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (!apply_setting(c, key, value)) {
      aeroinspect::core::logger()->warn("ignoring unknown config key '{}'", key);
    }
  }
  return c;
}

void apply_env_overrides(AppConfig& config) {
  for (const auto key : kKeys) {
    std::string name = "AEROINSPECT_";
    std::transform(key.begin(), key.end(), std::back_inserter(name),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (const char* value = std::getenv(name.c_str())) {
      std::string v(value);
      trim(v);
      apply_setting(config, key, v);
    }
  }
  if (const char* api_key = std::getenv("OPENAI_API_KEY")) {
    config.secondary.api_key = api_key;
  }
}

std::expected<void, std::string> validate_config(const AppConfig& c) {
  if (auto ensemble = c.ensemble.validate(); !ensemble) {
    return ensemble;
  }
  if (!in_unit_range(c.detection_threshold)) {
    return std::unexpected("detection_threshold must lie in [0, 1]");
  }
  if (!in_unit_range(c.model_nms_threshold)) {
    return std::unexpected("model_nms_threshold must lie in [0, 1]");
  }
  if (c.preprocessor.min_dimension == 0 || c.preprocessor.min_dimension > c.preprocessor.max_dimension) {
    return std::unexpected("min_dimension must be positive and not above max_dimension");
  }
  if (c.preprocessor.model_input_size == 0) {
    return std::unexpected("model_input_size must be positive");
  }
  if (c.preprocessor.quality_floor < 0.0 || c.preprocessor.quality_floor > 100.0) {
    return std::unexpected("quality_floor must lie in [0, 100]");
  }
  if (c.backend_type == InferenceBackendType::Onnx && c.model_path.empty()) {
    return std::unexpected("model_path is required for backend_type=onnx");
  }
  if (c.retry.max_attempts == 0) {
    return std::unexpected("secondary_max_attempts must be at least 1");
  }
  if (c.secondary.per_call_timeout.count() <= 0) {
    return std::unexpected("secondary_timeout_ms must be positive");
  }
  if (c.max_concurrent_jobs == 0) {
    return std::unexpected("max_concurrent_jobs must be at least 1");
  }
  if (c.coordinator.job_deadline.count() <= 0) {
    return std::unexpected("job_deadline_ms must be positive");
  }
  constexpr std::array<std::string_view, 7> kLevels = {"trace", "debug", "info", "warn",
                                                       "error", "critical", "off"};
  if (std::find(kLevels.begin(), kLevels.end(), c.log_level) == kLevels.end()) {
    return std::unexpected("log_level must be one of trace, debug, info, warn, error, critical, off");
  }
  return {};
}

}  // namespace aeroinspect::app
