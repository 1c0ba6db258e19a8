#include <aeroinspect/core/geometry.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

namespace ac = aeroinspect::core;

namespace {

ac::Detection det(ac::DefectClass c, float conf, ac::BBox b) {
  ac::Detection d;
  d.defect_class = c;
  d.confidence = conf;
  d.bbox = b;
  return d;
}

}  // namespace

TEST(Geometry, IouIdenticalIsOne) {
  ac::BBox b{10.f, 10.f, 50.f, 50.f};
  EXPECT_FLOAT_EQ(ac::iou(b, b), 1.f);
}

TEST(Geometry, IouDisjointIsZero) {
  EXPECT_FLOAT_EQ(ac::iou({0.f, 0.f, 10.f, 10.f}, {20.f, 20.f, 10.f, 10.f}), 0.f);
}

TEST(Geometry, IouTouchingEdgesIsZero) {
  EXPECT_FLOAT_EQ(ac::iou({0.f, 0.f, 10.f, 10.f}, {10.f, 0.f, 10.f, 10.f}), 0.f);
}

TEST(Geometry, IouPartialOverlap) {
  // Intersection 2400, union 2500 + 2496 - 2400 = 2596.
  const float v = ac::iou({100.f, 100.f, 50.f, 50.f}, {102.f, 98.f, 48.f, 52.f});
  EXPECT_NEAR(v, 2400.f / 2596.f, 1e-5f);
}

TEST(Geometry, IouIsSymmetric) {
  ac::BBox a{0.f, 0.f, 30.f, 20.f};
  ac::BBox b{10.f, 5.f, 30.f, 30.f};
  EXPECT_FLOAT_EQ(ac::iou(a, b), ac::iou(b, a));
}

TEST(Geometry, WellFormed) {
  EXPECT_TRUE(ac::is_well_formed({0.f, 0.f, 1.f, 1.f}));
  EXPECT_FALSE(ac::is_well_formed({0.f, 0.f, 0.f, 1.f}));
  EXPECT_FALSE(ac::is_well_formed({0.f, 0.f, -5.f, 1.f}));
  EXPECT_FALSE(ac::is_well_formed({std::numeric_limits<float>::quiet_NaN(), 0.f, 1.f, 1.f}));
  EXPECT_FALSE(ac::is_well_formed({0.f, 0.f, std::numeric_limits<float>::infinity(), 1.f}));
}

TEST(Geometry, ClampToImage) {
  auto c = ac::clamp_to_image({-10.f, 90.f, 30.f, 30.f}, 100, 100);
  ASSERT_TRUE(c.has_value());
  EXPECT_FLOAT_EQ(c->x, 0.f);
  EXPECT_FLOAT_EQ(c->y, 90.f);
  EXPECT_FLOAT_EQ(c->width, 20.f);
  EXPECT_FLOAT_EQ(c->height, 10.f);
  EXPECT_TRUE(ac::is_within(*c, 100, 100));
}

TEST(Geometry, ClampOutsideImageIsEmpty) {
  EXPECT_FALSE(ac::clamp_to_image({150.f, 10.f, 20.f, 20.f}, 100, 100).has_value());
}

TEST(Geometry, SuppressKeepsHighestOfOverlappingSameClass) {
  std::vector<ac::Detection> in = {
      det(ac::DefectClass::Scratch, 0.6f, {0.f, 0.f, 100.f, 100.f}),
      det(ac::DefectClass::Scratch, 0.9f, {5.f, 5.f, 100.f, 100.f}),
  };
  auto out = ac::suppress_overlaps(in, 0.4f);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.9f);
}

TEST(Geometry, SuppressIsClassScoped) {
  std::vector<ac::Detection> in = {
      det(ac::DefectClass::Scratch, 0.6f, {0.f, 0.f, 100.f, 100.f}),
      det(ac::DefectClass::Crack, 0.9f, {0.f, 0.f, 100.f, 100.f}),
  };
  auto out = ac::suppress_overlaps(in, 0.4f);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].defect_class, ac::DefectClass::Crack);
  EXPECT_EQ(out[1].defect_class, ac::DefectClass::Scratch);
}

TEST(Geometry, SuppressLeavesNoPairAtOrAboveThreshold) {
  std::vector<ac::Detection> in;
  for (int i = 0; i < 10; ++i) {
    in.push_back(det(ac::DefectClass::BurnMark, 0.5f + 0.04f * static_cast<float>(i),
                     {static_cast<float>(i * 8), 0.f, 40.f, 40.f}));
  }
  const float threshold = 0.4f;
  auto out = ac::suppress_overlaps(in, threshold);
  for (std::size_t i = 0; i < out.size(); ++i) {
    for (std::size_t j = i + 1; j < out.size(); ++j) {
      EXPECT_LT(ac::iou(out[i].bbox, out[j].bbox), threshold);
    }
    if (i > 0) {
      EXPECT_GE(out[i - 1].confidence, out[i].confidence);
    }
  }
}

TEST(Geometry, SortIsStableOnTies) {
  std::vector<ac::Detection> in = {
      det(ac::DefectClass::Scratch, 0.7f, {0.f, 0.f, 1.f, 1.f}),
      det(ac::DefectClass::Crack, 0.7f, {0.f, 0.f, 1.f, 1.f}),
      det(ac::DefectClass::BurnMark, 0.9f, {0.f, 0.f, 1.f, 1.f}),
  };
  ac::sort_by_confidence(in);
  EXPECT_EQ(in[0].defect_class, ac::DefectClass::BurnMark);
  EXPECT_EQ(in[1].defect_class, ac::DefectClass::Scratch);
  EXPECT_EQ(in[2].defect_class, ac::DefectClass::Crack);
}
