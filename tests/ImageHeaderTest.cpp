#include <gtest/gtest.h>

#include "TestSupport.h"
#include "core/ImageHeader.h"

using test_support::makeJpeg;
using test_support::makePng;

namespace {

TEST(ImageHeaderTest, ReadsPngDimensions) {
  const ImageBytes png = makePng(1080, 1920);
  ImageGeometry geometry;
  ASSERT_TRUE(probeImageGeometry(png.data(), png.size(), geometry));
  EXPECT_EQ(geometry.width, 1080u);
  EXPECT_EQ(geometry.height, 1920u);
  EXPECT_EQ(geometry.orientation, Orientation::kPortrait);
}

TEST(ImageHeaderTest, ReadsJpegFrameHeaderAfterAppSegments) {
  const ImageBytes jpeg = makeJpeg(3000, 2000);
  ImageGeometry geometry;
  ASSERT_TRUE(probeImageGeometry(jpeg.data(), jpeg.size(), geometry));
  EXPECT_EQ(geometry.width, 3000u);
  EXPECT_EQ(geometry.height, 2000u);
  EXPECT_EQ(geometry.orientation, Orientation::kLandscape);
}

TEST(ImageHeaderTest, ReadsGifLogicalScreen) {
  const ImageBytes gif = {'G', 'I', 'F', '8', '9', 'a', 0x40, 0x01, 0xF0, 0x00, 0x00, 0x00, 0x00};
  ImageGeometry geometry;
  ASSERT_TRUE(probeImageGeometry(gif.data(), gif.size(), geometry));
  EXPECT_EQ(geometry.width, 320u);
  EXPECT_EQ(geometry.height, 240u);
  EXPECT_EQ(geometry.orientation, Orientation::kLandscape);
}

TEST(ImageHeaderTest, ReadsTopDownBmp) {
  ImageBytes bmp(54, 0);
  bmp[0] = 'B';
  bmp[1] = 'M';
  bmp[14] = 40;
  // width 200, height -300 (top-down rows)
  bmp[18] = 200;
  const int32_t height = -300;
  const uint32_t raw = static_cast<uint32_t>(height);
  bmp[22] = static_cast<uint8_t>(raw);
  bmp[23] = static_cast<uint8_t>(raw >> 8);
  bmp[24] = static_cast<uint8_t>(raw >> 16);
  bmp[25] = static_cast<uint8_t>(raw >> 24);

  ImageGeometry geometry;
  ASSERT_TRUE(probeImageGeometry(bmp.data(), bmp.size(), geometry));
  EXPECT_EQ(geometry.width, 200u);
  EXPECT_EQ(geometry.height, 300u);
  EXPECT_EQ(geometry.orientation, Orientation::kPortrait);
}

TEST(ImageHeaderTest, SquareImageIsPortrait) {
  const ImageBytes png = makePng(500, 500);
  ImageGeometry geometry;
  ASSERT_TRUE(probeImageGeometry(png.data(), png.size(), geometry));
  EXPECT_EQ(geometry.orientation, Orientation::kPortrait);
}

TEST(ImageHeaderTest, RejectsUnknownOrTruncatedData) {
  ImageGeometry geometry;
  const ImageBytes text = {'<', 'h', 't', 'm', 'l', '>'};
  EXPECT_FALSE(probeImageGeometry(text.data(), text.size(), geometry));

  const ImageBytes png = makePng(10, 10);
  EXPECT_FALSE(probeImageGeometry(png.data(), 12, geometry));
  EXPECT_FALSE(probeImageGeometry(nullptr, 0, geometry));
}

}  // namespace
