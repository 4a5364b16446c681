// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/quality_table.h"

#include "lib/pio/testing.h"

namespace pio {
namespace {

constexpr Format kAllFormats[] = {Format::kJPEG, Format::kPNG, Format::kWebP};

TEST(QualityTableTest, TablesAreWellFormed) {
  for (Format format : kAllFormats) {
    const QualityTableEntry* table = GetQualityTable(format);
    const ParamRange range = NativeRange(format);
    for (size_t i = 0; i < kQualityTableSize; ++i) {
      EXPECT_EQ(static_cast<int>(i) * kQualityTableStep, table[i].quality);
      EXPECT_TRUE(range.Contains(table[i].native_param));
      EXPECT_GT(table[i].target_score, 0.0);
      if (i > 0) {
        EXPECT_LT(table[i].target_score, table[i - 1].target_score);
        EXPECT_GT(table[i].native_param, table[i - 1].native_param);
      }
    }
    EXPECT_EQ(range.min, table[0].native_param) << FormatName(format);
    EXPECT_EQ(range.max, table[kQualityTableSize - 1].native_param);
  }
}

TEST(QualityTableTest, InterpolatesLinearly) {
  const QualityTableEntry* table = GetQualityTable(Format::kJPEG);
  EXPECT_DOUBLE_EQ(table[16].target_score,
                   InterpolateTargetScore(Format::kJPEG, 80));
  EXPECT_DOUBLE_EQ(0.5 * (table[16].target_score + table[17].target_score),
                   InterpolateTargetScore(Format::kJPEG, 82.5));
}

TEST(QualityTableTest, ClampsOutsideDomain) {
  for (Format format : kAllFormats) {
    const QualityTableEntry* table = GetQualityTable(format);
    EXPECT_DOUBLE_EQ(table[0].target_score,
                     InterpolateTargetScore(format, -20));
    EXPECT_DOUBLE_EQ(table[kQualityTableSize - 1].target_score,
                     InterpolateTargetScore(format, 130));
    EXPECT_EQ(NativeRange(format).min, NearestNativeParam(format, -5));
    EXPECT_EQ(NativeRange(format).max, NearestNativeParam(format, 105));
  }
}

TEST(QualityTableTest, NearestNativeParamRounds) {
  EXPECT_EQ(73, NearestNativeParam(Format::kJPEG, 73.4));
  // Halfway between 32 and 40 colors.
  EXPECT_EQ(36, NearestNativeParam(Format::kPNG, 42.5));
}

TEST(QualityTableTest, BandAroundQuality) {
  OptimizeParams params;
  params.quality = 80;
  params.spread = 10;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params));
  EXPECT_EQ(70, target.min_param);
  EXPECT_EQ(90, target.max_param);
  EXPECT_DOUBLE_EQ(InterpolateTargetScore(Format::kJPEG, 80),
                   target.target_score);
}

TEST(QualityTableTest, BandIsClampedToNativeRange) {
  OptimizeParams params;
  params.quality = 95;
  params.spread = 20;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kWebP, ParamRange{0, 100}, params));
  EXPECT_EQ(75, target.min_param);
  EXPECT_EQ(100, target.max_param);
}

TEST(QualityTableTest, ZeroSpreadGivesSingleParameter) {
  OptimizeParams params;
  params.quality = 50;
  params.spread = 0;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kPNG, NativeRange(Format::kPNG), params));
  EXPECT_EQ(48, target.min_param);
  EXPECT_EQ(48, target.max_param);
}

TEST(QualityTableTest, ExplicitOverrides) {
  OptimizeParams params;
  params.quality = 80;
  params.target_score = 0.0123;
  params.min_param = 50;
  params.max_param = 50;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params));
  EXPECT_EQ(50, target.min_param);
  EXPECT_EQ(50, target.max_param);
  EXPECT_DOUBLE_EQ(0.0123, target.target_score);
}

TEST(QualityTableTest, ExplicitMinAloneOpensBandToNativeMax) {
  OptimizeParams params;
  params.quality = 80;
  params.spread = 10;
  params.min_param = 95;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params));
  EXPECT_EQ(95, target.min_param);
  EXPECT_EQ(100, target.max_param);
  EXPECT_DOUBLE_EQ(InterpolateTargetScore(Format::kJPEG, 80),
                   target.target_score);
}

TEST(QualityTableTest, ExplicitMaxAloneOpensBandToNativeMin) {
  OptimizeParams params;
  params.quality = 20;
  params.spread = 10;
  params.max_param = 5;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params));
  EXPECT_EQ(0, target.min_param);
  EXPECT_EQ(5, target.max_param);
}

TEST(QualityTableTest, ExplicitBoundIsClampedToNativeRange) {
  OptimizeParams params;
  params.quality = 50;
  params.max_param = 1000;
  PIO_TEST_ASSIGN_OR_DIE(
      QualityTarget target,
      DeriveQualityTarget(Format::kPNG, NativeRange(Format::kPNG), params));
  EXPECT_EQ(2, target.min_param);
  EXPECT_EQ(256, target.max_param);
}

TEST(QualityTableTest, EmptyBandIsAnError) {
  OptimizeParams params;
  params.min_param = 60;
  params.max_param = 40;
  StatusOr<QualityTarget> target =
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params);
  ASSERT_FALSE(target.ok());
  EXPECT_EQ(StatusCode::kGenericError, target.status().code());
}

TEST(QualityTableTest, NegativeSpreadIsAnError) {
  OptimizeParams params;
  params.spread = -1;
  EXPECT_FALSE(
      DeriveQualityTarget(Format::kJPEG, ParamRange{0, 100}, params).ok());
}

}  // namespace
}  // namespace pio
