// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec.h"

#include <cstdint>
#include <vector>

#include "lib/extras/codec_jpg.h"
#include "lib/pio/optimize.h"
#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace extras {
namespace {

// Left half red, right half blue.
PackedImage MakeTwoColorImage(size_t xsize, size_t ysize) {
  PackedImage image = test::MakeSolid(xsize, ysize, 230, 10, 10);
  for (size_t y = 0; y < ysize; ++y) {
    for (size_t x = xsize / 2; x < xsize; ++x) {
      image.Row(y)[3 * x + 0] = 10;
      image.Row(y)[3 * x + 2] = 230;
    }
  }
  return image;
}

std::vector<uint8_t> EncodeJpeg(const PackedImage& image) {
  JpegOptions options;
  options.chroma_subsampling = ChromaSubsampling::k444;
  std::vector<uint8_t> bytes;
  PIO_CHECK(EncodeImageJPG(image, 95, options, &bytes));
  return bytes;
}

// Inserts an APP1 segment with a big endian EXIF orientation right after SOI.
void AddOrientation(uint8_t orientation, std::vector<uint8_t>* jpeg) {
  std::vector<uint8_t> segment = {
      0xFF, 0xE1, 0,    0,    'E',  'x', 'i', 'f', 0, 0,
      'M',  'M',  0,    42,   0,    0,   0,   8,            // header
      0,    1,                                              // one entry
      0x01, 0x12, 0,    3,    0,    0,   0,   1,            // tag, type, count
      0,    orientation, 0, 0,                              // value
      0,    0,    0,    0};                                 // next IFD
  segment[3] = static_cast<uint8_t>(segment.size() - 2);
  jpeg->insert(jpeg->begin() + 2, segment.begin(), segment.end());
}

TEST(CodecTest, DetectFormat) {
  Format format;
  const std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE0};
  ASSERT_TRUE(DetectFormat(jpeg, &format));
  EXPECT_EQ(Format::kJPEG, format);
  const std::vector<uint8_t> png = {137, 'P', 'N', 'G', '\r', '\n', 26, '\n'};
  ASSERT_TRUE(DetectFormat(png, &format));
  EXPECT_EQ(Format::kPNG, format);
  const std::vector<uint8_t> webp = {'R', 'I', 'F', 'F', 0,   0,
                                     0,   0,   'W', 'E', 'B', 'P'};
  ASSERT_TRUE(DetectFormat(webp, &format));
  EXPECT_EQ(Format::kWebP, format);
  EXPECT_FALSE(DetectFormat({'G', 'I', 'F', '8', '9', 'a'}, &format));
  EXPECT_FALSE(DetectFormat({}, &format));
}

TEST(CodecTest, FormatFromPath) {
  Format format;
  ASSERT_TRUE(FormatFromPath("photo.JPG", &format));
  EXPECT_EQ(Format::kJPEG, format);
  ASSERT_TRUE(FormatFromPath("dir.v2/out.webp", &format));
  EXPECT_EQ(Format::kWebP, format);
  ASSERT_TRUE(FormatFromPath("a.b.png", &format));
  EXPECT_EQ(Format::kPNG, format);
  EXPECT_FALSE(FormatFromPath("dir.png/noext", &format));
  EXPECT_FALSE(FormatFromPath("image.gif", &format));
  EXPECT_FALSE(FormatFromPath("-", &format));
}

TEST(CodecTest, ParseFormatList) {
  std::vector<Format> formats;
  ASSERT_TRUE(ParseFormatList("webp,JPEG,png,jpg", &formats));
  const std::vector<Format> expected = {Format::kWebP, Format::kJPEG,
                                        Format::kPNG};
  EXPECT_EQ(expected, formats);
  EXPECT_FALSE(ParseFormatList("jpeg,gif", &formats));
  EXPECT_FALSE(ParseFormatList("", &formats));
  EXPECT_FALSE(ParseFormatList("png,", &formats));
}

TEST(CodecTest, AdaptersFollowFormatOrder) {
  OptimizeParams params;
  params.formats = {Format::kPNG, Format::kJPEG};
  const std::vector<CodecAdapter> adapters = MakeCodecAdapters(params);
  ASSERT_EQ(2u, adapters.size());
  EXPECT_EQ(Format::kPNG, adapters[0].format);
  EXPECT_EQ(2, adapters[0].native_range.min);
  EXPECT_EQ(256, adapters[0].native_range.max);
  EXPECT_EQ(Format::kJPEG, adapters[1].format);
  EXPECT_EQ(0, adapters[1].native_range.min);
  EXPECT_EQ(100, adapters[1].native_range.max);
}

TEST(CodecTest, AdapterDecodesOwnOutput) {
  const CodecAdapter adapter =
      MakeCodecAdapter(Format::kPNG, OptimizeParams());
  PackedImage image = test::MakeTestImage(20, 10);
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(adapter.encode(image, 64, &bytes));
  PIO_TEST_ASSIGN_OR_DIE(PackedImage decoded, adapter.decode(bytes));
  EXPECT_EQ(20u, decoded.xsize());
  EXPECT_EQ(10u, decoded.ysize());

  StatusOr<PackedImage> garbage = adapter.decode({1, 2, 3});
  ASSERT_FALSE(garbage.ok());
  EXPECT_EQ(StatusCode::kDecodeError, garbage.status().code());
  EXPECT_EQ(StatusCode::kEncodeError, adapter.encode(image, 1, &bytes).code());
}

TEST(CodecTest, UnknownBytesFailToDecode) {
  Format format;
  StatusOr<PackedImage> image = DecodeToSrgb({'B', 'M', 0, 0}, &format);
  ASSERT_FALSE(image.ok());
  EXPECT_EQ(StatusCode::kDecodeError, image.status().code());
}

TEST(CodecTest, DecodeToSrgbAppliesOrientation) {
  std::vector<uint8_t> jpeg = EncodeJpeg(MakeTwoColorImage(16, 8));
  Format format = Format::kPNG;
  PIO_TEST_ASSIGN_OR_DIE(PackedImage upright, DecodeToSrgb(jpeg, &format));
  EXPECT_EQ(Format::kJPEG, format);
  EXPECT_EQ(16u, upright.xsize());
  EXPECT_EQ(8u, upright.ysize());

  // Rotating clockwise moves the left edge to the top.
  AddOrientation(6, &jpeg);
  PIO_TEST_ASSIGN_OR_DIE(PackedImage rotated, DecodeToSrgb(jpeg, &format));
  ASSERT_EQ(8u, rotated.xsize());
  ASSERT_EQ(16u, rotated.ysize());
  const uint8_t* top = rotated.ConstRow(2) + 3 * 4;
  const uint8_t* bottom = rotated.ConstRow(13) + 3 * 4;
  EXPECT_GT(top[0], 180);
  EXPECT_LT(top[2], 60);
  EXPECT_LT(bottom[0], 60);
  EXPECT_GT(bottom[2], 180);
}

TEST(CodecTest, OptimizeWithJpegEncoder) {
  PackedImage image = test::AddNoise(test::MakeTestImage(64, 64), 4, 11);
  OptimizeParams params;
  params.quality = 80;
  params.trial_budget = 6;
  const std::vector<CodecAdapter> adapters = MakeCodecAdapters(params);
  size_t num_trials = 0;
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult result,
      Optimize(image, adapters, params, nullptr,
               [&num_trials](const TrialOutcome&, const QualityTarget&) {
                 ++num_trials;
               }));
  EXPECT_EQ(Format::kJPEG, result.format);
  EXPECT_TRUE(IsJPG(result.encoded.data(), result.encoded.size()));
  EXPECT_GE(result.parameter, 0);
  EXPECT_LE(result.parameter, 100);
  EXPECT_GT(num_trials, 0u);
  EXPECT_LE(num_trials, 6u);
  DecodedFile file;
  ASSERT_TRUE(DecodeImageJPG(result.encoded, &file));
  EXPECT_EQ(64u, file.image.xsize());
}

}  // namespace
}  // namespace extras
}  // namespace pio
