// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/packed_image.h"

#include <cstdint>
#include <vector>

#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace {

TEST(PackedImageTest, InvalidChannels) {
  EXPECT_FALSE(PackedImage::Create(4, 4, 1).ok());
  EXPECT_FALSE(PackedImage::Create(4, 4, 2).ok());
  EXPECT_FALSE(PackedImage::Create(4, 4, 5).ok());
}

TEST(PackedImageTest, Geometry) {
  PIO_TEST_ASSIGN_OR_DIE(PackedImage image, PackedImage::Create(5, 3, 4));
  EXPECT_EQ(5u, image.xsize());
  EXPECT_EQ(3u, image.ysize());
  EXPECT_EQ(20u, image.stride());
  EXPECT_EQ(60u, image.pixels_size());
  EXPECT_EQ(image.pixels() + 40, image.Row(2));
  EXPECT_TRUE(image.HasAlpha());
}

TEST(PackedImageTest, FromPixelsChecksSize) {
  std::vector<uint8_t> too_small(2 * 2 * 3 - 1);
  EXPECT_FALSE(PackedImage::FromPixels(2, 2, 3, std::move(too_small)).ok());
  std::vector<uint8_t> exact(2 * 2 * 3, 7);
  PIO_TEST_ASSIGN_OR_DIE(PackedImage image,
                         PackedImage::FromPixels(2, 2, 3, std::move(exact)));
  EXPECT_EQ(7, image.ConstRow(1)[5]);
}

TEST(PackedImageTest, Opaque) {
  EXPECT_TRUE(test::MakeSolid(3, 3, 1, 2, 3).IsOpaque());
  EXPECT_TRUE(test::MakeSolid(3, 3, 1, 2, 3, 255).IsOpaque());
  PackedImage image = test::MakeSolid(3, 3, 1, 2, 3, 255);
  image.Row(2)[4 * 2 + 3] = 254;
  EXPECT_FALSE(image.IsOpaque());
}

TEST(PackedImageTest, GrayToleratesOneLevel) {
  EXPECT_TRUE(test::MakeSolid(4, 4, 100, 101, 100).IsGray());
  EXPECT_FALSE(test::MakeSolid(4, 4, 100, 102, 100).IsGray());
  PackedImage image = test::MakeSolid(4, 4, 50, 50, 50, 0);
  EXPECT_TRUE(image.IsGray());
  image.Row(3)[4 * 3 + 2] = 60;
  EXPECT_FALSE(image.IsGray());
}

TEST(PackedImageTest, CopyIsDeep) {
  PackedImage image = test::MakeTestImage(8, 8);
  PackedImage copy = image.Copy();
  EXPECT_TRUE(copy.SamePixels(image));
  copy.Row(0)[0] ^= 1;
  EXPECT_FALSE(copy.SamePixels(image));
}

}  // namespace
}  // namespace pio
