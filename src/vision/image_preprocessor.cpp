#include <aeroinspect/vision/image_preprocessor.hpp>
#include "frame_cv_utils.hpp"
#include <aeroinspect/core/log.hpp>
#include <aeroinspect/vision/load_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace aeroinspect::vision {

namespace {

namespace ac = aeroinspect::core;

constexpr double kGlareBrightness = 180.0;
constexpr double kShadowBrightness = 80.0;

double score_quality(const cv::Mat& bgr) {
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

  cv::Mat laplacian;
  cv::Laplacian(gray, laplacian, CV_64F);
  cv::Scalar lap_mean;
  cv::Scalar lap_stddev;
  cv::meanStdDev(laplacian, lap_mean, lap_stddev);
  const double variance = lap_stddev[0] * lap_stddev[0];
  const double sharpness = std::min(variance / 1000.0, 1.0) * 50.0;

  const double brightness_mean = cv::mean(gray)[0];
  const double deviation = std::abs(brightness_mean - 128.0) / 128.0;
  const double brightness = (1.0 - deviation) * 50.0;

  return std::clamp(sharpness + brightness, 0.0, 100.0);
}

cv::Mat equalize(const cv::Mat& bgr, double clip_limit, int tile_grid) {
  cv::Mat lab;
  cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
  std::vector<cv::Mat> channels;
  cv::split(lab, channels);
  auto clahe = cv::createCLAHE(clip_limit, cv::Size(tile_grid, tile_grid));
  clahe->apply(channels[0], channels[0]);
  cv::merge(channels, lab);
  cv::Mat out;
  cv::cvtColor(lab, out, cv::COLOR_Lab2BGR);
  return out;
}

/// Edge-preserving smoothing, then pulls down glare or lifts shadows by mean brightness.
cv::Mat adaptive_filter(const cv::Mat& bgr) {
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  const double brightness = cv::mean(gray)[0];

  cv::Mat filtered;
  cv::bilateralFilter(bgr, filtered, 9, 75.0, 75.0);

  if (brightness > kGlareBrightness) {
    ac::logger()->debug("high brightness {:.1f}, reducing glare", brightness);
    filtered.convertTo(filtered, -1, 0.8, -20.0);
  } else if (brightness < kShadowBrightness) {
    ac::logger()->debug("low brightness {:.1f}, lifting shadows", brightness);
    filtered.convertTo(filtered, -1, 1.2, 20.0);
  }
  return filtered;
}

cv::Mat letterbox(const cv::Mat& bgr, int side, std::uint8_t pad_value, LetterboxTransform& t) {
  const double scale = std::min(static_cast<double>(side) / bgr.cols,
                                static_cast<double>(side) / bgr.rows);
  const int new_w = std::max(1, static_cast<int>(bgr.cols * scale));
  const int new_h = std::max(1, static_cast<int>(bgr.rows * scale));

  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);

  cv::Mat padded(side, side, CV_8UC3, cv::Scalar::all(pad_value));
  const int x_offset = (side - new_w) / 2;
  const int y_offset = (side - new_h) / 2;
  resized.copyTo(padded(cv::Rect(x_offset, y_offset, new_w, new_h)));

  t.scale = static_cast<float>(scale);
  t.pad_x = static_cast<float>(x_offset);
  t.pad_y = static_cast<float>(y_offset);
  return padded;
}

}  // namespace

ImagePreprocessor::ImagePreprocessor(PreprocessorConfig config) : config_(config) {
  ac::logger()->info("image preprocessor: range={}-{} model_input={} quality_floor={}",
                     config_.min_dimension, config_.max_dimension, config_.model_input_size,
                     config_.quality_floor);
}

std::expected<double, ac::PipelineError> ImagePreprocessor::quality_score(
    const ac::Frame& image) const {
  auto bgr = detail::frame_to_bgr(image);
  if (!bgr) {
    return std::unexpected(ac::PipelineError::InvalidImage);
  }
  try {
    return score_quality(*bgr);
  } catch (const cv::Exception& e) {
    ac::logger()->error("quality scoring failed: {}", e.what());
    return std::unexpected(ac::PipelineError::InvalidImage);
  }
}

std::expected<PreprocessedImage, ac::PipelineError> ImagePreprocessor::preprocess(
    const ac::Frame& image) const {
  auto bgr = detail::frame_to_bgr(image);
  if (!bgr) {
    ac::logger()->warn("rejecting image: empty or unsupported pixel buffer");
    return std::unexpected(ac::PipelineError::InvalidImage);
  }

  const auto w = image.width();
  const auto h = image.height();
  if (std::min(w, h) < config_.min_dimension || std::max(w, h) > config_.max_dimension) {
    ac::logger()->warn("rejecting image {}x{}: allowed range {}-{}", w, h,
                       config_.min_dimension, config_.max_dimension);
    return std::unexpected(ac::PipelineError::DimensionsOutOfRange);
  }

  PreprocessedImage out;
  try {
    out.quality_score = score_quality(*bgr);
    cv::Mat normalized = equalize(*bgr, config_.clahe_clip_limit, config_.clahe_tile_grid);
    normalized = adaptive_filter(normalized);
    cv::Mat model_input = letterbox(normalized, static_cast<int>(config_.model_input_size),
                                    config_.letterbox_pad_value, out.letterbox);
    out.normalized = detail::mat_to_frame(normalized, ac::PixelFormat::BGR8);
    out.model_input = detail::mat_to_frame(model_input, ac::PixelFormat::BGR8);
  } catch (const cv::Exception& e) {
    ac::logger()->error("preprocessing failed: {}", e.what());
    return std::unexpected(ac::PipelineError::InvalidImage);
  }

  if (out.quality_score < config_.quality_floor) {
    out.warnings.push_back(fmt::format("low image quality score {:.1f} (floor {:.1f})",
                                       out.quality_score, config_.quality_floor));
    ac::logger()->warn("image quality {:.1f} below floor {:.1f}", out.quality_score,
                       config_.quality_floor);
  }
  ac::logger()->debug("preprocessed {}x{} quality={:.1f}", w, h, out.quality_score);
  return out;
}

std::expected<PreprocessedImage, ac::PipelineError> ImagePreprocessor::preprocess_encoded(
    std::span<const std::byte> encoded) const {
  auto frame = decode_frame(encoded);
  if (!frame) {
    ac::logger()->warn("rejecting image: {} bytes could not be decoded", encoded.size());
    return std::unexpected(ac::PipelineError::InvalidImage);
  }
  return preprocess(*frame);
}

}  // namespace aeroinspect::vision
