#include <aeroinspect/core/error.hpp>
#include <aeroinspect/vision/retry_policy.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <random>

namespace av = aeroinspect::vision;
namespace ac = aeroinspect::core;

using std::chrono::milliseconds;

TEST(RetryPolicy, ExponentialBackoff) {
  av::RetryPolicy policy;
  EXPECT_EQ(policy.delay_before_retry(1), milliseconds(1000));
  EXPECT_EQ(policy.delay_before_retry(2), milliseconds(2000));
  EXPECT_EQ(policy.delay_before_retry(3), milliseconds(4000));
  EXPECT_EQ(policy.delay_before_retry(4), milliseconds(8000));
}

TEST(RetryPolicy, DelayCapped) {
  av::RetryPolicy policy;
  policy.max_delay = milliseconds(3000);
  EXPECT_EQ(policy.delay_before_retry(3), milliseconds(3000));
  EXPECT_EQ(policy.delay_before_retry(40), milliseconds(3000));
}

TEST(RetryPolicy, JitterStaysWithinHalfToFull) {
  av::RetryPolicy policy;
  policy.jitter = true;
  std::mt19937 rng(7);
  for (int i = 0; i < 50; ++i) {
    const auto d = policy.delay_before_retry(2, &rng);
    EXPECT_GE(d, milliseconds(1000));
    EXPECT_LE(d, milliseconds(2000));
  }
}

TEST(RetryPolicy, ShouldRetryOnlyTransientWithinBudget) {
  av::RetryPolicy policy;
  av::AttemptFailure transient{ac::PipelineError::Timeout, true, "timeout"};
  av::AttemptFailure final_failure{ac::PipelineError::DetectorUnavailable, false, "HTTP 401"};
  EXPECT_TRUE(policy.should_retry(transient, 1));
  EXPECT_TRUE(policy.should_retry(transient, 2));
  EXPECT_FALSE(policy.should_retry(transient, 3));
  EXPECT_FALSE(policy.should_retry(final_failure, 1));
}

TEST(RetryPolicy, ClassifyHttpStatus) {
  EXPECT_TRUE(av::classify_http_status(429).transient);
  EXPECT_TRUE(av::classify_http_status(500).transient);
  EXPECT_TRUE(av::classify_http_status(503).transient);
  EXPECT_FALSE(av::classify_http_status(400).transient);
  EXPECT_FALSE(av::classify_http_status(401).transient);
  EXPECT_FALSE(av::classify_http_status(404).transient);

  const auto f = av::classify_http_status(403);
  EXPECT_EQ(f.error, ac::PipelineError::DetectorUnavailable);
  EXPECT_EQ(f.detail, "HTTP 403");
}
