// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/evaluator.h"

#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace {

TEST(EvaluatorTest, IdenticalImagesScoreZero) {
  PackedImage image = test::MakeTestImage(64, 48);
  PIO_TEST_ASSIGN_OR_DIE(double score, ComputeDissimilarity(image, image));
  EXPECT_EQ(0.0, score);
}

TEST(EvaluatorTest, DimensionMismatch) {
  PackedImage a = test::MakeTestImage(32, 32);
  PackedImage b = test::MakeTestImage(32, 31);
  StatusOr<double> score = ComputeDissimilarity(a, b);
  ASSERT_FALSE(score.ok());
  EXPECT_EQ(StatusCode::kDimensionMismatch, score.status().code());
}

TEST(EvaluatorTest, EmptySourceFails) {
  PIO_TEST_ASSIGN_OR_DIE(PackedImage empty, PackedImage::Create(0, 0, 3));
  EXPECT_FALSE(Evaluator::Create(empty).ok());
}

TEST(EvaluatorTest, MoreNoiseScoresHigher) {
  PackedImage image = test::MakeTestImage(96, 64);
  PackedImage light = test::AddNoise(image, 4, 1);
  PackedImage heavy = test::AddNoise(image, 40, 1);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  PIO_TEST_ASSIGN_OR_DIE(double light_score, evaluator.Compare(light));
  PIO_TEST_ASSIGN_OR_DIE(double heavy_score, evaluator.Compare(heavy));
  EXPECT_GT(light_score, 0.0);
  EXPECT_GT(heavy_score, light_score);
  EXPECT_LE(heavy_score, 1.0);
}

TEST(EvaluatorTest, Deterministic) {
  PackedImage image = test::MakeTestImage(40, 40);
  PackedImage noisy = test::AddNoise(image, 10, 7);
  PIO_TEST_ASSIGN_OR_DIE(double first, ComputeDissimilarity(image, noisy));
  PIO_TEST_ASSIGN_OR_DIE(double second, ComputeDissimilarity(image, noisy));
  EXPECT_EQ(first, second);
}

TEST(EvaluatorTest, MatchesOneShotComparison) {
  PackedImage image = test::MakeTestImage(50, 30);
  PackedImage noisy = test::AddNoise(image, 12, 3);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  PIO_TEST_ASSIGN_OR_DIE(double cached, evaluator.Compare(noisy));
  PIO_TEST_ASSIGN_OR_DIE(double one_shot, ComputeDissimilarity(image, noisy));
  EXPECT_DOUBLE_EQ(one_shot, cached);
}

TEST(EvaluatorTest, TinyImagesUseOneScale) {
  PackedImage image = test::MakeTestImage(5, 3);
  PackedImage noisy = test::AddNoise(image, 30, 5);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  PIO_TEST_ASSIGN_OR_DIE(Ssimulacra details, evaluator.CompareDetailed(noisy));
  EXPECT_EQ(1u, details.scales.size());
  EXPECT_GE(details.Score(), 0.0);
}

TEST(EvaluatorTest, InvisiblePixelsDoNotCount) {
  PackedImage a = test::MakeSolid(16, 16, 255, 0, 0, 0);
  PackedImage b = test::MakeSolid(16, 16, 0, 0, 255, 0);
  PIO_TEST_ASSIGN_OR_DIE(double score, ComputeDissimilarity(a, b));
  EXPECT_NEAR(0.0, score, 1e-6);
}

}  // namespace
}  // namespace pio
