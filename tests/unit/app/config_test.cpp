#include <aeroinspect/app/config.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace aa = aeroinspect::app;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string write(const std::string& contents) {
    std::ofstream out(path_);
    out << contents;
    return path_.string();
  }

  std::filesystem::path path_ = std::filesystem::temp_directory_path() /
                                ("aeroinspect_config_test_" +
                                 std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                                 ".conf");
};

}  // namespace

TEST(Config, DefaultsAreValid) {
  const auto c = aa::default_config();
  EXPECT_EQ(c.backend_type, aa::InferenceBackendType::Mock);
  EXPECT_FLOAT_EQ(c.ensemble.primary_weight, 0.6f);
  EXPECT_FLOAT_EQ(c.ensemble.secondary_weight, 0.4f);
  EXPECT_EQ(c.max_concurrent_jobs, 5u);
  EXPECT_EQ(c.coordinator.job_deadline, std::chrono::milliseconds(30000));
  EXPECT_EQ(c.retry.max_attempts, 3u);
  EXPECT_TRUE(aa::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = aa::load_config("/nonexistent/aeroinspect/config.conf");
  EXPECT_EQ(c.max_concurrent_jobs, 5u);
  EXPECT_EQ(c.log_level, "info");
}

TEST_F(ConfigFileTest, LoadsKeyValueFile) {
  const auto path = write(
      "# ensemble\n"
      "primary_weight = 0.7\n"
      "secondary_weight=0.3\n"
      "\n"
      "backend_type=onnx\n"
      "model_path = models/defects.onnx\n"
      "secondary_endpoint=https://vision.example/v1/chat/completions\n"
      "secondary_max_attempts=5\n"
      "secondary_jitter=true\n"
      "max_concurrent_jobs=8\n"
      "job_deadline_ms=15000\n"
      "log_level=debug\n"
      "not_a_key=1\n");
  const auto c = aa::load_config(path);
  EXPECT_FLOAT_EQ(c.ensemble.primary_weight, 0.7f);
  EXPECT_FLOAT_EQ(c.ensemble.secondary_weight, 0.3f);
  EXPECT_EQ(c.backend_type, aa::InferenceBackendType::Onnx);
  EXPECT_EQ(c.model_path, "models/defects.onnx");
  EXPECT_EQ(c.secondary.endpoint, "https://vision.example/v1/chat/completions");
  EXPECT_EQ(c.retry.max_attempts, 5u);
  EXPECT_TRUE(c.retry.jitter);
  EXPECT_EQ(c.max_concurrent_jobs, 8u);
  EXPECT_EQ(c.coordinator.job_deadline, std::chrono::milliseconds(15000));
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_TRUE(aa::validate_config(c).has_value());
}

TEST_F(ConfigFileTest, MalformedValueThrows) {
  const auto path = write("primary_weight=heavy\n");
  try {
    (void)aa::load_config(path);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("primary_weight"), std::string::npos);
  }
  EXPECT_THROW((void)aa::load_config(write("max_concurrent_jobs=-2\n")), std::invalid_argument);
  EXPECT_THROW((void)aa::load_config(write("backend_type=gpu\n")), std::invalid_argument);
}

TEST(Config, WeightsMustSumToOne) {
  auto c = aa::default_config();
  c.ensemble.primary_weight = 0.7f;
  const auto v = aa::validate_config(c);
  ASSERT_FALSE(v.has_value());
  EXPECT_NE(v.error().find("primary_weight + secondary_weight"), std::string::npos);
}

TEST(Config, RangeChecks) {
  {
    auto c = aa::default_config();
    c.detection_threshold = 1.5f;
    EXPECT_FALSE(aa::validate_config(c).has_value());
  }
  {
    auto c = aa::default_config();
    c.backend_type = aa::InferenceBackendType::Onnx;
    EXPECT_FALSE(aa::validate_config(c).has_value());
  }
  {
    auto c = aa::default_config();
    c.max_concurrent_jobs = 0;
    EXPECT_FALSE(aa::validate_config(c).has_value());
  }
  {
    auto c = aa::default_config();
    c.preprocessor.min_dimension = 5000;
    EXPECT_FALSE(aa::validate_config(c).has_value());
  }
  {
    auto c = aa::default_config();
    c.log_level = "loud";
    EXPECT_FALSE(aa::validate_config(c).has_value());
  }
}

TEST(Config, EnvironmentOverrides) {
  ::setenv("AEROINSPECT_MAX_CONCURRENT_JOBS", "3", 1);
  ::setenv("AEROINSPECT_SECONDARY_ENDPOINT", " http://localhost:9000/v1 ", 1);
  ::setenv("OPENAI_API_KEY", "sk-test", 1);
  auto c = aa::default_config();
  aa::apply_env_overrides(c);
  ::unsetenv("AEROINSPECT_MAX_CONCURRENT_JOBS");
  ::unsetenv("AEROINSPECT_SECONDARY_ENDPOINT");
  ::unsetenv("OPENAI_API_KEY");

  EXPECT_EQ(c.max_concurrent_jobs, 3u);
  EXPECT_EQ(c.secondary.endpoint, "http://localhost:9000/v1");
  EXPECT_EQ(c.secondary.api_key, "sk-test");
}

TEST(Config, MalformedEnvironmentValueThrows) {
  ::setenv("AEROINSPECT_JOB_DEADLINE_MS", "soon", 1);
  auto c = aa::default_config();
  EXPECT_THROW(aa::apply_env_overrides(c), std::invalid_argument);
  ::unsetenv("AEROINSPECT_JOB_DEADLINE_MS");
}
