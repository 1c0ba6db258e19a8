#include <aeroinspect/app/result_json.hpp>
#include <aeroinspect/core/ensemble_result.hpp>
#include <gtest/gtest.h>
#include <string>
#include "test_doubles.hpp"

namespace aa = aeroinspect::app;
namespace ac = aeroinspect::core;
namespace at = aeroinspect::test;

TEST(ResultJson, DetectionFields) {
  auto d = at::make_detection(ac::DefectClass::FiliformCorrosion, 0.75f, {1.f, 2.f, 3.f, 4.f},
                              ac::DetectionSource::Ensemble);
  auto j = aa::detection_to_json(d);
  EXPECT_EQ(j["class"], "filiform_corrosion");
  EXPECT_FLOAT_EQ(j["confidence"].get<float>(), 0.75f);
  EXPECT_FLOAT_EQ(j["bbox"]["x"].get<float>(), 1.f);
  EXPECT_FLOAT_EQ(j["bbox"]["height"].get<float>(), 4.f);
  EXPECT_EQ(j["source"], "ensemble");
  EXPECT_FALSE(j.contains("description"));

  d.description = "streaks under paint";
  EXPECT_EQ(aa::detection_to_json(d)["description"], "streaks under paint");
}

TEST(ResultJson, ResultEnvelope) {
  ac::EnsembleResult r;
  r.detections = {at::make_detection(ac::DefectClass::Crack, 0.85f, {101.f, 99.f, 49.f, 51.f},
                                     ac::DetectionSource::Ensemble)};
  r.processing_time_ms = 1234.5;
  r.degraded = true;
  r.warnings = {"secondary detector timed out; results from primary detector only"};
  r.quality_score = 72.0;
  r.primary_count = 2;
  r.secondary_count = 0;
  r.image_width = 1920;
  r.image_height = 1080;

  auto j = aa::result_to_json(r);
  ASSERT_TRUE(j["defects"].is_array());
  EXPECT_EQ(j["defects"].size(), 1u);
  EXPECT_EQ(j["defects"][0]["class"], "crack");
  EXPECT_DOUBLE_EQ(j["processingTimeMs"].get<double>(), 1234.5);
  EXPECT_TRUE(j["degraded"].get<bool>());
  EXPECT_EQ(j["warnings"].size(), 1u);
  EXPECT_DOUBLE_EQ(j["qualityScore"].get<double>(), 72.0);
  EXPECT_EQ(j["metadata"]["primaryDetections"], 2);
  EXPECT_EQ(j["metadata"]["secondaryDetections"], 0);
  EXPECT_EQ(j["metadata"]["finalDetections"], 1);
  EXPECT_EQ(j["metadata"]["imageWidth"], 1920);
  EXPECT_EQ(j["metadata"]["imageHeight"], 1080);
}

TEST(ResultJson, EmptyResultHasEmptyDefects) {
  auto j = aa::result_to_json(ac::EnsembleResult{});
  ASSERT_TRUE(j["defects"].is_array());
  EXPECT_TRUE(j["defects"].empty());
  EXPECT_FALSE(j["degraded"].get<bool>());
}

TEST(ResultJson, ErrorEnvelope) {
  auto j = aa::error_to_json(ac::PipelineError::DimensionsOutOfRange);
  EXPECT_EQ(j["error"]["code"], "INVALID_IMAGE");
  EXPECT_EQ(j["error"]["message"], "image dimensions out of range");
  EXPECT_EQ(aa::error_to_json(ac::PipelineError::AllBackendsUnavailable)["error"]["code"],
            "ALL_BACKENDS_UNAVAILABLE");
}
