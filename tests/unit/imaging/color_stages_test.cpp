#include <gnomon/imaging/color_convert_stage.hpp>
#include <gnomon/imaging/flatten_alpha_stage.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace ni = gnomon::imaging;
namespace nc = gnomon::core;

namespace {

/// 2x1 frame with the given per-pixel samples repeated.
nc::Frame make_frame(nc::PixelFormat format, std::initializer_list<int> pixel) {
  std::vector<std::byte> buf;
  for (int i = 0; i < 2; ++i) {
    for (int v : pixel) buf.push_back(static_cast<std::byte>(v));
  }
  return nc::Frame(2, 1, format, std::move(buf));
}

int sample(const nc::Frame& f, std::size_t i) {
  return static_cast<int>(f.data()[i]);
}

}  // namespace

TEST(FlattenAlphaStage, TransparentBecomesWhite) {
  ni::FlattenAlphaStage stage;
  auto out = stage.process(make_frame(nc::PixelFormat::BGRA8, {0, 0, 0, 0}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::BGR8);
  ASSERT_EQ(out->size_bytes(), 6u);
  for (std::size_t i = 0; i < 6; ++i) EXPECT_EQ(sample(*out, i), 255);
}

TEST(FlattenAlphaStage, OpaqueKeepsColor) {
  ni::FlattenAlphaStage stage;
  auto out = stage.process(make_frame(nc::PixelFormat::BGRA8, {10, 20, 30, 255}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(sample(*out, 0), 10);
  EXPECT_EQ(sample(*out, 1), 20);
  EXPECT_EQ(sample(*out, 2), 30);
}

TEST(FlattenAlphaStage, HalfAlphaBlendsWithBackground) {
  ni::FlattenAlphaStage stage(ni::Rgb{0, 0, 200});
  // RGBA order: background blue 200 sits in the third sample.
  auto out = stage.process(make_frame(nc::PixelFormat::RGBA8, {100, 100, 0, 128}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::RGB8);
  EXPECT_NEAR(sample(*out, 0), 50, 1);
  EXPECT_NEAR(sample(*out, 1), 50, 1);
  EXPECT_NEAR(sample(*out, 2), 99, 1);
}

TEST(FlattenAlphaStage, NoAlphaPassesThrough) {
  ni::FlattenAlphaStage stage;
  auto out = stage.process(make_frame(nc::PixelFormat::Grayscale8, {77}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::Grayscale8);
  EXPECT_EQ(sample(*out, 0), 77);
}

TEST(ColorConvertStage, GrayscaleToBgr) {
  ni::ColorConvertStage stage;
  auto out = stage.process(make_frame(nc::PixelFormat::Grayscale8, {90}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), nc::PixelFormat::BGR8);
  ASSERT_EQ(out->size_bytes(), 6u);
  for (std::size_t i = 0; i < 6; ++i) EXPECT_EQ(sample(*out, i), 90);
}

TEST(ColorConvertStage, RgbToBgrSwapsChannels) {
  ni::ColorConvertStage stage(nc::PixelFormat::BGR8);
  auto out = stage.process(make_frame(nc::PixelFormat::RGB8, {1, 2, 3}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(sample(*out, 0), 3);
  EXPECT_EQ(sample(*out, 1), 2);
  EXPECT_EQ(sample(*out, 2), 1);
}

TEST(ColorConvertStage, SameFormatUnchanged) {
  ni::ColorConvertStage stage(nc::PixelFormat::BGR8);
  auto out = stage.process(make_frame(nc::PixelFormat::BGR8, {4, 5, 6}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(sample(*out, 0), 4);
}

TEST(ColorConvertStage, UnknownFormatRejected) {
  ni::ColorConvertStage stage(nc::PixelFormat::BGR8);
  auto out = stage.process(make_frame(nc::PixelFormat::Unknown, {1}));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), nc::PhotoError::InvalidFrame);
}
