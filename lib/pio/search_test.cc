// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/search.h"

#include <atomic>
#include <memory>
#include <vector>

#include "lib/pio/test_utils.h"
#include "lib/pio/testing.h"
#include "lib/threads/thread_parallel_runner_internal.h"

namespace pio {
namespace {

using ::testing::ElementsAre;

SearchResult MakeResult(size_t size, double score, double target) {
  SearchResult result;
  result.encoded.resize(size);
  result.score = score;
  result.target_score = target;
  result.satisfies_target = score <= target;
  return result;
}

TEST(IsBetterResultTest, SatisfyingBeatsNonSatisfying) {
  EXPECT_TRUE(IsBetterResult(MakeResult(5000, 0.01, 0.02),
                             MakeResult(100, 0.03, 0.02)));
  EXPECT_FALSE(IsBetterResult(MakeResult(100, 0.03, 0.02),
                              MakeResult(5000, 0.01, 0.02)));
}

TEST(IsBetterResultTest, SmallerSatisfyingWins) {
  EXPECT_TRUE(IsBetterResult(MakeResult(1800, 0.019, 0.02),
                             MakeResult(2000, 0.001, 0.02)));
  EXPECT_FALSE(IsBetterResult(MakeResult(2000, 0.001, 0.02),
                              MakeResult(1800, 0.019, 0.02)));
}

TEST(IsBetterResultTest, EqualSizePrefersLowerScore) {
  EXPECT_TRUE(IsBetterResult(MakeResult(1000, 0.005, 0.02),
                             MakeResult(1000, 0.010, 0.02)));
  EXPECT_FALSE(IsBetterResult(MakeResult(1000, 0.010, 0.02),
                              MakeResult(1000, 0.005, 0.02)));
}

TEST(IsBetterResultTest, ClosestToTargetWhenNoneSatisfies) {
  EXPECT_TRUE(IsBetterResult(MakeResult(9000, 0.05, 0.02),
                             MakeResult(1000, 0.08, 0.02)));
  // Relative to each result's own target.
  EXPECT_TRUE(IsBetterResult(MakeResult(1000, 0.06, 0.05),
                             MakeResult(1000, 0.04, 0.02)));
}

TEST(IsBetterResultTest, ExactTieKeepsEarlier) {
  EXPECT_FALSE(IsBetterResult(MakeResult(1000, 0.01, 0.02),
                              MakeResult(1000, 0.01, 0.02)));
  EXPECT_FALSE(IsBetterResult(MakeResult(1000, 0.05, 0.02),
                              MakeResult(1000, 0.05, 0.02)));
}

class SearchTest : public ::testing::Test {
 protected:
  SearchTest() : image_(test::MakeTestImage(40, 40)) {}

  void SetUp() override {
    PIO_TEST_ASSIGN_OR_DIE(Evaluator evaluator, Evaluator::Create(image_));
    evaluator_ = std::make_unique<Evaluator>(std::move(evaluator));
  }

  FormatCandidate Candidate(const CodecAdapter& adapter, int min_param,
                            int max_param, double target_score) const {
    return FormatCandidate{adapter,
                           QualityTarget{target_score, min_param, max_param},
                           &image_, evaluator_.get()};
  }

  StatusOr<SearchResult> Search(
      const std::vector<FormatCandidate>& candidates, size_t budget = 8,
      std::vector<SearchResult>* per_format = nullptr) {
    SearchOptions options;
    options.trial_budget = budget;
    TrialScheduler scheduler(nullptr);
    return SearchBestEncoding(candidates, options, &scheduler, per_format);
  }

  PackedImage image_;
  std::unique_ptr<Evaluator> evaluator_;
};

TEST_F(SearchTest, SingleParameterBandRunsOneTrial) {
  test::FakeCodecOptions options;
  options.parameters = std::make_shared<std::vector<int>>();
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(adapter, 50, 50, 0.02)}));
  EXPECT_THAT(*options.parameters, ElementsAre(50));
  EXPECT_EQ(50, result.parameter);
  EXPECT_EQ(1u, result.num_trials);
  EXPECT_EQ(Format::kJPEG, result.format);
}

TEST_F(SearchTest, BisectsTowardSmallestSatisfyingParameter) {
  test::FakeCodecOptions options;
  options.exact_from = 85;
  options.parameters = std::make_shared<std::vector<int>>();
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(adapter, 0, 100, 0.0)}));
  EXPECT_THAT(*options.parameters, ElementsAre(50, 75, 88, 81, 84, 86, 85));
  EXPECT_EQ(85, result.parameter);
  EXPECT_TRUE(result.satisfies_target);
  EXPECT_EQ(0.0, result.score);
  EXPECT_EQ(7u, result.num_trials);
}

TEST_F(SearchTest, BudgetBoundsTrials) {
  test::FakeCodecOptions options;
  options.exact_from = 200;
  options.num_encodes = std::make_shared<std::atomic<int>>(0);
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kPNG, ParamRange{2, 256}, options);
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(adapter, 2, 256, 0.0)}, 3));
  EXPECT_EQ(3, options.num_encodes->load());
  EXPECT_EQ(3u, result.num_trials);
  EXPECT_GE(result.parameter, 2);
  EXPECT_LE(result.parameter, 256);
}

TEST_F(SearchTest, ClosestScoreWhenTargetUnreachable) {
  test::FakeCodecOptions options;
  options.exact_from = 101;
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100}, options);
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(adapter, 60, 100, 0.0)}));
  // Every trial misses the target; the least distorted one is at the top of
  // the band.
  EXPECT_FALSE(result.satisfies_target);
  EXPECT_EQ(100, result.parameter);
  EXPECT_GT(result.score, 0.0);
}

TEST_F(SearchTest, AllEncodersFailingIsNoViableEncoding) {
  test::FakeCodecOptions options;
  options.fail_encode = true;
  options.num_encodes = std::make_shared<std::atomic<int>>(0);
  CodecAdapter jpeg =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  CodecAdapter webp =
      test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100}, options);
  StatusOr<SearchResult> result = Search(
      {Candidate(jpeg, 0, 100, 0.02), Candidate(webp, 0, 100, 0.02)});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(StatusCode::kNoViableEncoding, result.status().code());
  EXPECT_LE(options.num_encodes->load(), 16);
}

TEST_F(SearchTest, EncodeFailureMovesTowardLessCompression) {
  test::FakeCodecOptions options;
  options.parameters = std::make_shared<std::vector<int>>();
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  // Rejects everything below 60.
  CodecAdapter picky = adapter;
  picky.encode = [adapter](const PackedImage& image, int parameter,
                           std::vector<uint8_t>* bytes) -> Status {
    if (parameter < 60) {
      return PIO_STATUS(StatusCode::kEncodeError, "rejected");
    }
    return adapter.encode(image, parameter, bytes);
  };
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(picky, 0, 100, 0.02)}));
  EXPECT_THAT(*options.parameters, ElementsAre(75, 62, 60));
  EXPECT_EQ(60, result.parameter);
  EXPECT_EQ(6u, result.num_trials);
}

TEST_F(SearchTest, SmallestSatisfyingFormatWinsRegardlessOfOrder) {
  test::FakeCodecOptions big;
  big.padding = [](int) { return size_t{2000}; };
  test::FakeCodecOptions small;
  small.padding = [](int) { return size_t{1800}; };
  CodecAdapter jpeg = test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100},
                                            big);
  CodecAdapter webp = test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100},
                                            small);
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult first,
      Search({Candidate(jpeg, 40, 60, 0.02), Candidate(webp, 40, 60, 0.02)}));
  EXPECT_EQ(Format::kWebP, first.format);
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult second,
      Search({Candidate(webp, 40, 60, 0.02), Candidate(jpeg, 40, 60, 0.02)}));
  EXPECT_EQ(Format::kWebP, second.format);
  EXPECT_EQ(first.encoded.size(), second.encoded.size());
}

TEST_F(SearchTest, ExactTieAcrossFormatsKeepsFirstFormat) {
  test::FakeCodecOptions options;
  options.padding = [](int) { return size_t{100}; };
  CodecAdapter jpeg =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  CodecAdapter webp =
      test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100}, options);
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult result,
      Search({Candidate(webp, 10, 10, 0.02), Candidate(jpeg, 10, 10, 0.02)}));
  EXPECT_EQ(Format::kWebP, result.format);
}

TEST_F(SearchTest, DecodeFailureDropsOnlyThatFormat) {
  test::FakeCodecOptions corrupt;
  corrupt.corrupt_output = true;
  corrupt.num_encodes = std::make_shared<std::atomic<int>>(0);
  CodecAdapter broken =
      test::MakeFakeAdapter(Format::kPNG, ParamRange{2, 256}, corrupt);
  CodecAdapter good = test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100},
                                            test::FakeCodecOptions());
  std::vector<SearchResult> per_format;
  PIO_TEST_ASSIGN_OR_DIE(SearchResult result,
                         Search({Candidate(broken, 2, 256, 0.02),
                                 Candidate(good, 0, 100, 0.02)},
                                8, &per_format));
  EXPECT_EQ(Format::kJPEG, result.format);
  EXPECT_EQ(1, corrupt.num_encodes->load());
  ASSERT_EQ(1u, per_format.size());
  EXPECT_EQ(Format::kJPEG, per_format[0].format);
}

TEST_F(SearchTest, DimensionMismatchDropsFormat) {
  test::FakeCodecOptions narrow;
  narrow.wrong_size = true;
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100}, narrow);
  StatusOr<SearchResult> result = Search({Candidate(adapter, 0, 100, 0.02)});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(StatusCode::kNoViableEncoding, result.status().code());
}

TEST_F(SearchTest, EmptyBandIsAnError) {
  CodecAdapter adapter = test::MakeFakeAdapter(
      Format::kJPEG, ParamRange{0, 100}, test::FakeCodecOptions());
  StatusOr<SearchResult> result = Search({Candidate(adapter, 60, 40, 0.02)});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(StatusCode::kGenericError, result.status().code());
}

TEST_F(SearchTest, DeadlineStopsAfterFirstRound) {
  test::FakeCodecOptions options;
  options.exact_from = 90;
  options.num_encodes = std::make_shared<std::atomic<int>>(0);
  CodecAdapter adapter =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, options);
  SearchOptions search_options;
  search_options.deadline_seconds = 1e-9;
  TrialScheduler scheduler(nullptr);
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult result,
      SearchBestEncoding({Candidate(adapter, 0, 100, 0.0)}, search_options,
                         &scheduler));
  EXPECT_EQ(1, options.num_encodes->load());
  EXPECT_EQ(50, result.parameter);
}

TEST_F(SearchTest, ConcurrentFormatsMatchSequential) {
  test::FakeCodecOptions jpeg_options;
  jpeg_options.exact_from = 70;
  test::FakeCodecOptions webp_options;
  webp_options.exact_from = 40;
  CodecAdapter jpeg =
      test::MakeFakeAdapter(Format::kJPEG, ParamRange{0, 100}, jpeg_options);
  CodecAdapter webp =
      test::MakeFakeAdapter(Format::kWebP, ParamRange{0, 100}, webp_options);
  const std::vector<FormatCandidate> candidates = {
      Candidate(jpeg, 0, 100, 0.0), Candidate(webp, 0, 100, 0.0)};
  std::vector<SearchResult> sequential;
  PIO_TEST_ASSIGN_OR_DIE(SearchResult expected,
                         Search(candidates, 8, &sequential));

  ThreadParallelRunner runner(3);
  ThreadPool pool(&ThreadParallelRunner::Runner, &runner);
  TrialScheduler scheduler(&pool);
  std::vector<SearchResult> parallel;
  PIO_TEST_ASSIGN_OR_DIE(
      SearchResult actual,
      SearchBestEncoding(candidates, SearchOptions(), &scheduler, &parallel));
  EXPECT_EQ(expected.format, actual.format);
  EXPECT_EQ(expected.parameter, actual.parameter);
  ASSERT_EQ(2u, parallel.size());
  ASSERT_EQ(2u, sequential.size());
  EXPECT_EQ(70, parallel[0].parameter);
  EXPECT_EQ(40, parallel[1].parameter);
  EXPECT_EQ(Format::kWebP, actual.format);
}

}  // namespace
}  // namespace pio
