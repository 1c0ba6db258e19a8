#include <aeroinspect/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace ac = aeroinspect::core;

TEST(Frame, DefaultEmpty) {
  ac::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  ac::Frame f(100, 100, ac::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), ac::PixelFormat::BGR8);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.size_bytes(), 100u * 100 * 3);
  EXPECT_TRUE(f.is_consistent());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(ac::Frame::min_bytes(10, 10, ac::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(ac::Frame::min_bytes(10, 10, ac::PixelFormat::RGB8), 300u);
  EXPECT_EQ(ac::Frame::min_bytes(10, 10, ac::PixelFormat::Float32RGB), 10u * 10 * 3 * 4);
  EXPECT_EQ(ac::Frame::min_bytes(10, 10, ac::PixelFormat::Unknown), 0u);
}

TEST(Frame, TruncatedBufferIsInconsistent) {
  std::vector<std::byte> buf(100 * 100 * 3 - 1);
  ac::Frame f(100, 100, ac::PixelFormat::BGR8, std::move(buf));
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, UnknownFormatIsInconsistent) {
  std::vector<std::byte> buf(64);
  ac::Frame f(8, 8, ac::PixelFormat::Unknown, std::move(buf));
  EXPECT_FALSE(f.is_consistent());
}
