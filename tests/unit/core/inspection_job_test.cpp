#include <aeroinspect/core/error.hpp>
#include <aeroinspect/core/inspection_job.hpp>
#include <gtest/gtest.h>

namespace ac = aeroinspect::core;

TEST(InspectionJob, StartsQueued) {
  ac::InspectionJob job;
  EXPECT_EQ(job.state, ac::JobState::Queued);
  EXPECT_FALSE(job.primary_result.has_value());
  EXPECT_FALSE(job.secondary_result.has_value());
  EXPECT_FALSE(job.failure.has_value());
}

TEST(InspectionJob, TerminalStates) {
  EXPECT_TRUE(ac::is_terminal(ac::JobState::Completed));
  EXPECT_TRUE(ac::is_terminal(ac::JobState::Failed));
  EXPECT_FALSE(ac::is_terminal(ac::JobState::Queued));
  EXPECT_FALSE(ac::is_terminal(ac::JobState::Detecting));
}

TEST(InspectionJob, StateNames) {
  EXPECT_EQ(ac::to_string(ac::JobState::Preprocessing), "preprocessing");
  EXPECT_EQ(ac::to_string(ac::JobState::Aggregating), "aggregating");
}

TEST(PipelineError, ExternalCodes) {
  EXPECT_EQ(ac::error_code(ac::PipelineError::InvalidImage), "INVALID_IMAGE");
  EXPECT_EQ(ac::error_code(ac::PipelineError::DimensionsOutOfRange), "INVALID_IMAGE");
  EXPECT_EQ(ac::error_code(ac::PipelineError::AllBackendsUnavailable), "ALL_BACKENDS_UNAVAILABLE");
  EXPECT_EQ(ac::error_code(ac::PipelineError::InvalidConfig), "INVALID_CONFIG");
  EXPECT_TRUE(ac::is_input_error(ac::PipelineError::DimensionsOutOfRange));
  EXPECT_FALSE(ac::is_input_error(ac::PipelineError::Timeout));
}

TEST(DetectionSet, FailureCarriesError) {
  auto s = ac::DetectionSet::failure(ac::PipelineError::Timeout, 12.5);
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(*s.error, ac::PipelineError::Timeout);
  EXPECT_DOUBLE_EQ(s.latency_ms, 12.5);
  EXPECT_TRUE(s.detections.empty());
}
