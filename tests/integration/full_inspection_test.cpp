#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/app/inspection_runner.hpp>
#include <aeroinspect/app/inspection_service.hpp>
#include <aeroinspect/app/result_json.hpp>
#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/frame.hpp>
#include <aeroinspect/vision/defect_decoder.hpp>
#include <aeroinspect/vision/image_preprocessor.hpp>
#include <aeroinspect/vision/mock_inference_backend.hpp>
#include <aeroinspect/vision/model_handle.hpp>
#include <aeroinspect/vision/primary_detector.hpp>
#include <aeroinspect/vision/secondary_detector.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "test_doubles.hpp"

namespace {

using namespace aeroinspect::core;
using namespace aeroinspect::vision;
using namespace aeroinspect::app;
namespace at = aeroinspect::test;

const std::string kRemoteCrack =
    R"(```json
[{"class":"crack","confidence":0.8,"bbox":{"x":102,"y":98,"width":48,"height":52},"description":"linear crack"}]
```)";

std::string chat_envelope(const std::string& content) {
  nlohmann::json envelope = nlohmann::json::object();
  nlohmann::json choice = nlohmann::json::object();
  choice["message"]["role"] = "assistant";
  choice["message"]["content"] = content;
  envelope["choices"] = nlohmann::json::array();
  envelope["choices"].push_back(choice);
  return envelope.dump();
}

/// Mock model that reports one crack. On a 1280x960 image (scale 0.5, pad_y 80) the model box
/// (50, 130) 25x25 is the image box (100, 100) 50x50.
std::shared_ptr<ModelHandle> crack_model() {
  return std::make_shared<ModelHandle>([]() -> std::unique_ptr<IInferenceBackend> {
    auto mock = std::make_unique<MockInferenceBackend>();
    mock->set_detections({at::make_detection(DefectClass::Crack, 0.9f, {50.f, 130.f, 25.f, 25.f})});
    return mock;
  });
}

SecondaryConfig remote_config() {
  SecondaryConfig cfg;
  cfg.endpoint = "http://vision.test/v1/chat/completions";
  return cfg;
}

struct Rig {
  std::shared_ptr<at::ScriptedTransport> transport = std::make_shared<at::ScriptedTransport>();
  at::RecordingSleeper sleeper;
  std::shared_ptr<const InferenceCoordinator> coordinator;

  explicit Rig(std::shared_ptr<ModelHandle> model) {
    auto primary = std::make_shared<PrimaryDetector>(std::move(model), DefectDecoder(0.5f, 0.45f));
    auto secondary = std::make_shared<SecondaryDetector>(transport, remote_config(), RetryPolicy{},
                                                         sleeper);
    coordinator = std::make_shared<const InferenceCoordinator>(
        std::make_shared<const ImagePreprocessor>(), primary, secondary, EnsembleConfig{});
  }
};

}  // namespace

TEST(FullInspectionTest, MergesLocalAndRemoteCrack) {
  Rig rig(crack_model());
  rig.transport->push_ok(chat_envelope(kRemoteCrack));
  InspectionService service(rig.coordinator, 5);

  auto result = service.submit(at::make_textured_frame(1280, 960));
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->degraded);
  ASSERT_EQ(result->detections.size(), 1u);
  const auto& d = result->detections[0];
  EXPECT_EQ(d.defect_class, DefectClass::Crack);
  EXPECT_EQ(d.source, DetectionSource::Ensemble);
  EXPECT_NEAR(d.confidence, 0.85f, 1e-5f);
  EXPECT_NEAR(d.bbox.x, 101.f, 1e-2f);
  EXPECT_NEAR(d.bbox.y, 99.f, 1e-2f);
  EXPECT_NEAR(d.bbox.width, 49.f, 1e-2f);
  EXPECT_NEAR(d.bbox.height, 51.f, 1e-2f);
  ASSERT_TRUE(d.description.has_value());
  EXPECT_EQ(*d.description, "linear crack");

  const auto j = result_to_json(*result);
  EXPECT_EQ(j["defects"][0]["source"], "ensemble");
  EXPECT_EQ(j["metadata"]["primaryDetections"], 1);
  EXPECT_EQ(j["metadata"]["secondaryDetections"], 1);
  EXPECT_EQ(j["metadata"]["imageWidth"], 1280);
}

TEST(FullInspectionTest, RemoteOutageDegradesToPrimary) {
  Rig rig(crack_model());
  rig.transport->push_status(503);
  InspectionService service(rig.coordinator, 5);

  auto result = service.submit(at::make_textured_frame(1280, 960));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->degraded);
  EXPECT_EQ(rig.transport->calls, 3);
  EXPECT_EQ(rig.sleeper.delays->size(), 2u);
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_EQ(result->detections[0].source, DetectionSource::Primary);
  EXPECT_NEAR(result->detections[0].bbox.x, 100.f, 1e-2f);
}

TEST(FullInspectionTest, NothingAvailableFailsJob) {
  auto broken = std::make_shared<ModelHandle>(
      []() -> std::unique_ptr<IInferenceBackend> { throw std::runtime_error("weights missing"); });
  Rig rig(broken);
  rig.transport->push_status(401);
  InspectionService service(rig.coordinator, 5);

  auto result = service.submit(at::make_textured_frame(1280, 960));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), PipelineError::AllBackendsUnavailable);
  EXPECT_EQ(error_to_json(result.error())["error"]["code"], "ALL_BACKENDS_UNAVAILABLE");
}

TEST(FullInspectionTest, EncodedImagesThroughBatchRunner) {
  Rig rig(crack_model());
  rig.transport->push_ok(chat_envelope("[]"));
  InspectionService service(rig.coordinator, 2);

  cv::Mat img(960, 1280, CV_8UC3);
  cv::randu(img, cv::Scalar::all(60), cv::Scalar::all(200));
  std::vector<uchar> jpeg;
  ASSERT_TRUE(cv::imencode(".jpg", img, jpeg));
  std::vector<std::byte> bytes(jpeg.size());
  for (std::size_t i = 0; i < jpeg.size(); ++i) bytes[i] = static_cast<std::byte>(jpeg[i]);

  auto encoded = service.submit_encoded(bytes);
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(encoded->image_width, 1280u);
  ASSERT_EQ(encoded->detections.size(), 1u);
  EXPECT_EQ(encoded->detections[0].source, DetectionSource::Primary);

  std::vector<Frame> frames = {at::make_textured_frame(1280, 960), at::make_textured_frame(100, 100),
                               at::make_textured_frame(1280, 960)};
  std::mutex mutex;
  std::vector<bool> ok(frames.size(), false);
  run_inspection_batch_parallel(service, frames, [&](std::size_t i, const InspectionOutcome& o) {
    std::lock_guard lock(mutex);
    ok[i] = o.has_value();
  });
  EXPECT_TRUE(ok[0]);
  EXPECT_FALSE(ok[1]);
  EXPECT_TRUE(ok[2]);
}
