#include <aeroinspect/app/inference_coordinator.hpp>
#include <aeroinspect/app/inspection_runner.hpp>
#include <aeroinspect/app/inspection_service.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include "test_doubles.hpp"

namespace aa = aeroinspect::app;
namespace ac = aeroinspect::core;
namespace av = aeroinspect::vision;
namespace at = aeroinspect::test;

namespace {

std::shared_ptr<const aa::InferenceCoordinator> make_coordinator() {
  ac::DetectionSet primary;
  primary.detections = {at::make_detection(ac::DefectClass::MissingRivet, 0.92f, {50.f, 60.f, 20.f, 20.f})};
  return std::make_shared<const aa::InferenceCoordinator>(
      std::make_shared<const av::ImagePreprocessor>(),
      std::make_shared<at::StubPrimaryDetector>(primary),
      std::make_shared<at::StubSecondaryDetector>(
          ac::DetectionSet::failure(ac::PipelineError::DetectorUnavailable)),
      ac::EnsembleConfig{});
}

std::vector<ac::Frame> make_batch() {
  std::vector<ac::Frame> images;
  images.push_back(at::make_textured_frame(700, 700));
  images.push_back(at::make_textured_frame(320, 240));  // too small
  images.push_back(at::make_textured_frame(800, 640));
  images.push_back(ac::Frame{});
  images.push_back(at::make_textured_frame(640, 900));
  return images;
}

void expect_outcomes(const std::vector<aa::InspectionOutcome>& outcomes) {
  ASSERT_EQ(outcomes.size(), 5u);
  EXPECT_TRUE(outcomes[0].has_value());
  ASSERT_FALSE(outcomes[1].has_value());
  EXPECT_EQ(outcomes[1].error(), ac::PipelineError::DimensionsOutOfRange);
  EXPECT_TRUE(outcomes[2].has_value());
  ASSERT_FALSE(outcomes[3].has_value());
  EXPECT_EQ(outcomes[3].error(), ac::PipelineError::InvalidImage);
  ASSERT_TRUE(outcomes[4].has_value());
  EXPECT_TRUE(outcomes[4]->degraded);
  ASSERT_EQ(outcomes[4]->detections.size(), 1u);
  EXPECT_EQ(outcomes[4]->detections[0].defect_class, ac::DefectClass::MissingRivet);
}

}  // namespace

TEST(InspectionRunner, SequentialCallsBackInOrder) {
  aa::InspectionService service(make_coordinator(), 2);
  const auto images = make_batch();
  std::vector<std::size_t> order;
  std::vector<aa::InspectionOutcome> outcomes(images.size(),
                                              std::unexpected(ac::PipelineError::None));
  aa::run_inspection_batch(service, images, [&](std::size_t i, const aa::InspectionOutcome& o) {
    order.push_back(i);
    outcomes[i] = o;
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
  expect_outcomes(outcomes);
}

TEST(InspectionRunner, ParallelCallsBackOncePerImage) {
  aa::InspectionService service(make_coordinator(), 2);
  const auto images = make_batch();
  std::mutex mutex;
  std::vector<int> seen(images.size(), 0);
  std::vector<aa::InspectionOutcome> outcomes(images.size(),
                                              std::unexpected(ac::PipelineError::None));
  aa::run_inspection_batch_parallel(
      service, images,
      [&](std::size_t i, const aa::InspectionOutcome& o) {
        std::lock_guard lock(mutex);
        ++seen[i];
        outcomes[i] = o;
      },
      4);
  for (int count : seen) EXPECT_EQ(count, 1);
  expect_outcomes(outcomes);
  EXPECT_EQ(service.governor().in_flight(), 0u);
}

TEST(InspectionRunner, EmptyBatchDoesNothing) {
  aa::InspectionService service(make_coordinator(), 2);
  std::atomic<int> calls{0};
  aa::run_inspection_batch_parallel(service, {}, [&](std::size_t, const aa::InspectionOutcome&) {
    ++calls;
  });
  EXPECT_EQ(calls.load(), 0);
}
