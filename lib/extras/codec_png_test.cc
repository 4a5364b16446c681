// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_png.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "lib/pio/evaluator.h"
#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace extras {
namespace {

std::vector<uint8_t> Encode(const PackedImage& image, int num_colors,
                            const PngOptions& options = PngOptions()) {
  std::vector<uint8_t> bytes;
  PIO_CHECK(EncodeImagePNG(image, num_colors, options, &bytes));
  return bytes;
}

bool HasChunk(const std::vector<uint8_t>& bytes, const char* type) {
  const std::string needle(type, 4);
  return std::search(bytes.begin(), bytes.end(), needle.begin(),
                     needle.end()) != bytes.end();
}

TEST(CodecPngTest, RoundTripKeepsDimensions) {
  PackedImage image = test::MakeTestImage(57, 31);
  const std::vector<uint8_t> bytes = Encode(image, 64);
  ASSERT_TRUE(IsPNG(bytes.data(), bytes.size()));
  DecodedFile file;
  ASSERT_TRUE(DecodeImagePNG(bytes, &file));
  EXPECT_EQ(57u, file.image.xsize());
  EXPECT_EQ(31u, file.image.ysize());
  EXPECT_EQ(3u, file.image.num_channels());
  EXPECT_EQ(Format::kPNG, file.format);
}

TEST(CodecPngTest, WritesColorChunks) {
  const std::vector<uint8_t> bytes = Encode(test::MakeTestImage(16, 16), 16);
  EXPECT_TRUE(HasChunk(bytes, "PLTE"));
  EXPECT_TRUE(HasChunk(bytes, "sRGB"));
  EXPECT_TRUE(HasChunk(bytes, "gAMA"));
  EXPECT_TRUE(HasChunk(bytes, "cHRM"));
  EXPECT_FALSE(HasChunk(bytes, "tRNS"));
}

TEST(CodecPngTest, FewColorsAreLossless) {
  PackedImage image = test::MakeSolid(10, 10, 1, 2, 3);
  for (size_t x = 0; x < 5; ++x) {
    uint8_t* p = image.Row(7) + 3 * x;
    p[0] = 250;
    p[1] = 128;
    p[2] = 7;
  }
  for (int colors : {2, 4, 256}) {
    DecodedFile file;
    ASSERT_TRUE(DecodeImagePNG(Encode(image, colors), &file));
    EXPECT_TRUE(file.image.SamePixels(image)) << colors;
  }
}

TEST(CodecPngTest, KeepsTransparency) {
  PackedImage image = test::MakeSolid(8, 8, 200, 10, 10, 255);
  for (size_t x = 0; x < 8; ++x) image.Row(0)[4 * x + 3] = 0;
  const std::vector<uint8_t> bytes = Encode(image, 8);
  EXPECT_TRUE(HasChunk(bytes, "tRNS"));
  DecodedFile file;
  ASSERT_TRUE(DecodeImagePNG(bytes, &file));
  ASSERT_EQ(4u, file.image.num_channels());
  EXPECT_EQ(0, file.image.ConstRow(0)[3]);
  EXPECT_EQ(255, file.image.ConstRow(1)[3]);
  EXPECT_EQ(200, file.image.ConstRow(1)[0]);
}

TEST(CodecPngTest, MoreColorsIsLarger) {
  PackedImage image = test::AddNoise(test::MakeTestImage(64, 64), 8, 5);
  PngOptions options;
  options.dither = false;
  EXPECT_LT(Encode(image, 4, options).size(),
            Encode(image, 256, options).size());
}

TEST(CodecPngTest, EncodeErrors) {
  std::vector<uint8_t> bytes;
  PackedImage image = test::MakeTestImage(8, 8);
  EXPECT_EQ(StatusCode::kEncodeError,
            EncodeImagePNG(image, 1, PngOptions(), &bytes).code());
  EXPECT_EQ(StatusCode::kEncodeError,
            EncodeImagePNG(image, 257, PngOptions(), &bytes).code());
}

TEST(CodecPngTest, DecodeErrors) {
  DecodedFile file;
  EXPECT_EQ(StatusCode::kDecodeError,
            DecodeImagePNG({0, 1, 2, 3, 4, 5, 6, 7, 8}, &file).code());
  std::vector<uint8_t> truncated = Encode(test::MakeTestImage(32, 32), 64);
  truncated.resize(truncated.size() / 2);
  EXPECT_EQ(StatusCode::kDecodeError, DecodeImagePNG(truncated, &file).code());
}

TEST(CodecPngTest, ScoreMostlyImprovesWithColors) {
  PackedImage image = test::AddNoise(test::MakeTestImage(96, 96), 6, 11);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  std::vector<double> scores;
  for (int colors = 16; colors <= 256; colors += 16) {
    DecodedFile file;
    ASSERT_TRUE(DecodeImagePNG(Encode(image, colors), &file));
    PIO_TEST_ASSIGN_OR_DIE(double score, evaluator.Compare(file.image));
    scores.push_back(score);
  }
  EXPECT_GE(test::FractionNonIncreasing(scores, 1e-4), 0.9);
  EXPECT_LT(scores.back(), scores.front());
}

}  // namespace
}  // namespace extras
}  // namespace pio
