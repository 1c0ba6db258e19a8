#include <aeroinspect/core/defect.hpp>
#include <aeroinspect/core/error.hpp>
#include <aeroinspect/vision/vision_response_parser.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace av = aeroinspect::vision;
namespace ac = aeroinspect::core;

namespace {

const std::string kCrack =
    R"([{"class":"crack","confidence":0.8,"bbox":{"x":102,"y":98,"width":48,"height":52},)"
    R"("description":"hairline crack near rivet row"}])";

}  // namespace

TEST(VisionResponseParser, BareArray) {
  auto out = av::parse_vision_response(kCrack, 1024, 768);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->detections.size(), 1u);
  const auto& d = out->detections[0];
  EXPECT_EQ(d.defect_class, ac::DefectClass::Crack);
  EXPECT_EQ(d.source, ac::DetectionSource::Secondary);
  EXPECT_FLOAT_EQ(d.confidence, 0.8f);
  EXPECT_FLOAT_EQ(d.bbox.x, 102.f);
  EXPECT_FLOAT_EQ(d.bbox.height, 52.f);
  ASSERT_TRUE(d.description.has_value());
  EXPECT_EQ(*d.description, "hairline crack near rivet row");
  EXPECT_EQ(out->rejected, 0u);
}

TEST(VisionResponseParser, FencedBlock) {
  auto out = av::parse_vision_response("```json\n" + kCrack + "\n```", 1024, 768);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->detections.size(), 1u);
}

TEST(VisionResponseParser, SurroundingProse) {
  auto out = av::parse_vision_response("Here are the defects I found:\n" + kCrack +
                                           "\nLet me know if you need more.",
                                       1024, 768);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->detections.size(), 1u);
}

TEST(VisionResponseParser, SingleLineFencedBlock) {
  auto out = av::parse_vision_response("```json " + kCrack + " ```", 1024, 768);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->detections.size(), 1u);
}

TEST(VisionResponseParser, BracketsInProseBeforeFence) {
  auto out = av::parse_vision_response("I found [1] defect:\n```json\n" + kCrack + "\n```", 1024,
                                       768);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->detections.size(), 1u);
  EXPECT_EQ(out->rejected, 0u);
}

TEST(VisionResponseParser, BracketsInUnfencedProseAreSkipped) {
  auto out = av::parse_vision_response("Region [A] shows one defect: " + kCrack + " (see [note])",
                                       1024, 768);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->detections.size(), 1u);
  EXPECT_EQ(out->detections[0].defect_class, ac::DefectClass::Crack);
}

TEST(VisionResponseParser, DefectsObject) {
  auto out = av::parse_vision_response(R"({"defects":)" + kCrack + "}", 1024, 768);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->detections.size(), 1u);
}

TEST(VisionResponseParser, EmptyArrayIsNoDefects) {
  auto out = av::parse_vision_response("[]", 1024, 768);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->detections.empty());
}

TEST(VisionResponseParser, InvalidRecordsDroppedIndividually) {
  const std::string text = R"([
    {"class":"corrosion","confidence":0.9,"bbox":{"x":1,"y":1,"width":10,"height":10}},
    {"class":"scratch","bbox":{"x":1,"y":1,"width":10,"height":10}},
    {"class":"scratch","confidence":0.7,"bbox":{"x":5000,"y":1,"width":10,"height":10}},
    "not an object",
    {"class":"burn_mark","confidence":1.7,"bbox":{"x":-10,"y":20,"width":30,"height":30}}
  ])";
  auto out = av::parse_vision_response(text, 1024, 768);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->detections.size(), 1u);
  EXPECT_EQ(out->rejected, 4u);
  const auto& d = out->detections[0];
  EXPECT_EQ(d.defect_class, ac::DefectClass::BurnMark);
  EXPECT_FLOAT_EQ(d.confidence, 1.f);
  EXPECT_FLOAT_EQ(d.bbox.x, 0.f);
  EXPECT_FLOAT_EQ(d.bbox.width, 20.f);
}

TEST(VisionResponseParser, MalformedText) {
  for (const std::string text : {"", "   ", "I could not see any aircraft.", "[{\"class\":", "{\"foo\":1}"}) {
    auto out = av::parse_vision_response(text, 1024, 768);
    ASSERT_FALSE(out.has_value()) << text;
    EXPECT_EQ(out.error(), ac::PipelineError::MalformedResponse);
  }
}

TEST(VisionResponseParser, UnwrapsChatCompletion) {
  nlohmann::json envelope;
  envelope["id"] = "chatcmpl-1";
  nlohmann::json choice = {{"index", 0},
                           {"message", {{"role", "assistant"}, {"content", kCrack}}}};
  envelope["choices"] = nlohmann::json::array();
  envelope["choices"].push_back(choice);
  EXPECT_EQ(av::unwrap_chat_completion(envelope.dump()), kCrack);
}

TEST(VisionResponseParser, NonEnvelopePassesThrough) {
  EXPECT_EQ(av::unwrap_chat_completion(kCrack), kCrack);
  EXPECT_EQ(av::unwrap_chat_completion("plain text"), "plain text");
}
