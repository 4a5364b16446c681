// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/progress.h"

#include <string>

#include "lib/pio/codec_adapter.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"

namespace pio {
namespace tools {
namespace {

TEST(ProgressTest, Percent) {
  EXPECT_DOUBLE_EQ(50.0, Percent(50, 100));
  EXPECT_DOUBLE_EQ(0.0, Percent(50, 0));
}

TEST(ProgressTest, SuccessfulTrial) {
  TrialOutcome outcome;
  outcome.trial.format = Format::kWebP;
  outcome.trial.parameter = 72;
  outcome.trial.encoded.resize(250);
  outcome.trial.score = 0.0125;
  const std::string line =
      TrialLine(outcome, QualityTarget{0.02, 65, 85}, 1000);
  EXPECT_EQ(
      "webp range 65 - 85 quality 72, SSIM 0.012500 250 bytes, 25.0 % of "
      "original\n",
      line);
}

TEST(ProgressTest, FailedTrialNamesFormatAndStatus) {
  test::FakeCodecOptions corrupt;
  corrupt.corrupt_output = true;
  const CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kPNG, ParamRange{2, 256}, corrupt);
  const PackedImage image = test::MakeTestImage(32, 32);
  PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image));
  const TrialOutcome outcome =
      TrialScheduler::RunTrial(TrialRequest{&adapter, &image, &evaluator, 64});
  ASSERT_FALSE(outcome.status);
  const std::string line =
      TrialLine(outcome, QualityTarget{0.02, 32, 128}, 1000);
  EXPECT_EQ("png range 32 - 128 quality 64 trial failed (decode error)\n",
            line);
}

}  // namespace
}  // namespace tools
}  // namespace pio
