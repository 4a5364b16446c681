// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_jpg.h"

#include <cstdint>
#include <vector>

#include "lib/pio/evaluator.h"
#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace extras {
namespace {

std::vector<uint8_t> Encode(const PackedImage& image, int quality,
                            const JpegOptions& options = JpegOptions()) {
  std::vector<uint8_t> bytes;
  PIO_CHECK(EncodeImageJPG(image, quality, options, &bytes));
  return bytes;
}

TEST(CodecJpgTest, RoundTripKeepsDimensions) {
  PackedImage image = test::MakeTestImage(67, 41);
  const std::vector<uint8_t> bytes = Encode(image, 90);
  ASSERT_TRUE(IsJPG(bytes.data(), bytes.size()));
  DecodedFile file;
  ASSERT_TRUE(DecodeImageJPG(bytes, &file));
  EXPECT_EQ(67u, file.image.xsize());
  EXPECT_EQ(41u, file.image.ysize());
  EXPECT_EQ(3u, file.image.num_channels());
  EXPECT_TRUE(file.icc.empty());
  EXPECT_TRUE(file.exif.empty());
  EXPECT_EQ(Format::kJPEG, file.format);
}

TEST(CodecJpgTest, HigherQualityIsLarger) {
  PackedImage image = test::AddNoise(test::MakeTestImage(64, 64), 10, 3);
  const std::vector<uint8_t> low = Encode(image, 20);
  const std::vector<uint8_t> high = Encode(image, 95);
  EXPECT_LT(low.size(), high.size());
}

TEST(CodecJpgTest, AllChromaSubsamplingModes) {
  PackedImage image = test::MakeTestImage(33, 17);
  for (ChromaSubsampling cs :
       {ChromaSubsampling::k420, ChromaSubsampling::k422,
        ChromaSubsampling::k444}) {
    JpegOptions options;
    options.chroma_subsampling = cs;
    const std::vector<uint8_t> bytes = Encode(image, 80, options);
    DecodedFile file;
    ASSERT_TRUE(DecodeImageJPG(bytes, &file));
    EXPECT_EQ(33u, file.image.xsize());
    EXPECT_EQ(17u, file.image.ysize());
  }
}

TEST(CodecJpgTest, GrayImageIsSingleChannel) {
  PackedImage gray = test::MakeSolid(16, 16, 90, 90, 90);
  PackedImage color = test::MakeSolid(16, 16, 90, 20, 200);
  const std::vector<uint8_t> gray_bytes = Encode(gray, 85);
  const std::vector<uint8_t> color_bytes = Encode(color, 85);
  // One component instead of three.
  EXPECT_LT(gray_bytes.size(), color_bytes.size());
  DecodedFile file;
  ASSERT_TRUE(DecodeImageJPG(gray_bytes, &file));
  ASSERT_EQ(3u, file.image.num_channels());
  EXPECT_TRUE(file.image.IsGray());
}

TEST(CodecJpgTest, EncodeErrors) {
  std::vector<uint8_t> bytes;
  PackedImage image = test::MakeTestImage(8, 8);
  Status status = EncodeImageJPG(image, 101, JpegOptions(), &bytes);
  EXPECT_EQ(StatusCode::kEncodeError, status.code());
  status = EncodeImageJPG(image, -1, JpegOptions(), &bytes);
  EXPECT_EQ(StatusCode::kEncodeError, status.code());
  PackedImage rgba = test::MakeTestImage(8, 8, 4);
  status = EncodeImageJPG(rgba, 80, JpegOptions(), &bytes);
  EXPECT_EQ(StatusCode::kEncodeError, status.code());
}

TEST(CodecJpgTest, DecodeErrors) {
  DecodedFile file;
  std::vector<uint8_t> garbage = {1, 2, 3, 4};
  EXPECT_EQ(StatusCode::kDecodeError, DecodeImageJPG(garbage, &file).code());
  std::vector<uint8_t> truncated = Encode(test::MakeTestImage(32, 32), 80);
  truncated.resize(40);
  EXPECT_EQ(StatusCode::kDecodeError, DecodeImageJPG(truncated, &file).code());
}

TEST(CodecJpgTest, ReadsExifAndIcc) {
  std::vector<uint8_t> bytes = Encode(test::MakeTestImage(16, 8), 80);
  const std::vector<uint8_t> tiff = {'M', 'M', 0, 42, 0, 0, 0, 8,
                                     0,   0,   0, 0,  0, 0};
  std::vector<uint8_t> exif_segment = {0xFF, 0xE1, 0,   0,   'E',
                                       'x',  'i',  'f', 0,   0};
  exif_segment.insert(exif_segment.end(), tiff.begin(), tiff.end());
  exif_segment[3] = static_cast<uint8_t>(exif_segment.size() - 2);
  const std::vector<uint8_t> icc = {10, 20, 30, 40, 50};
  std::vector<uint8_t> icc_segment = {0xFF, 0xE2, 0,   0,   'I', 'C', 'C',
                                      '_',  'P',  'R', 'O', 'F', 'I', 'L',
                                      'E',  0,    1,   1};
  icc_segment.insert(icc_segment.end(), icc.begin(), icc.end());
  icc_segment[3] = static_cast<uint8_t>(icc_segment.size() - 2);
  // Right after SOI.
  bytes.insert(bytes.begin() + 2, icc_segment.begin(), icc_segment.end());
  bytes.insert(bytes.begin() + 2, exif_segment.begin(), exif_segment.end());

  DecodedFile file;
  ASSERT_TRUE(DecodeImageJPG(bytes, &file));
  EXPECT_EQ(tiff, file.exif);
  EXPECT_EQ(icc, file.icc);
}

TEST(CodecJpgTest, ScoreMostlyImprovesWithQuality) {
  PackedImage image = test::AddNoise(test::MakeTestImage(96, 96), 6, 11);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  std::vector<double> scores;
  for (int quality = 10; quality <= 100; quality += 5) {
    DecodedFile file;
    ASSERT_TRUE(DecodeImageJPG(Encode(image, quality), &file));
    PIO_TEST_ASSIGN_OR_DIE(double score, evaluator.Compare(file.image));
    scores.push_back(score);
  }
  EXPECT_GE(test::FractionNonIncreasing(scores, 1e-4), 0.9);
  EXPECT_LT(scores.back(), scores.front());
}

}  // namespace
}  // namespace extras
}  // namespace pio
