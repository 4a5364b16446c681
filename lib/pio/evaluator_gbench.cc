// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include <utility>

#include "benchmark/benchmark.h"
#include "lib/pio/base/status.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/test_utils.h"

namespace pio {
namespace {

#define QUIT(M)           \
  state.SkipWithError(M); \
  return;

#define BM_CHECK(C) \
  if (!(C)) {       \
    QUIT(#C)        \
  }

void BM_EvaluatorCreate(benchmark::State& state) {
  const size_t size = state.range();
  const PackedImage image = test::MakeTestImage(size, size);
  for (auto _ : state) {
    StatusOr<Evaluator> evaluator = Evaluator::Create(image);
    BM_CHECK(evaluator.ok());
  }
  state.SetItemsProcessed(size * size * state.iterations());
}

void BM_EvaluatorCompare(benchmark::State& state) {
  const size_t size = state.range();
  const PackedImage image = test::MakeTestImage(size, size);
  const PackedImage noisy = test::AddNoise(image, 6, 1);
  StatusOr<Evaluator> created = Evaluator::Create(image);
  BM_CHECK(created.ok());
  const Evaluator evaluator = std::move(created).value_();
  for (auto _ : state) {
    StatusOr<double> score = evaluator.Compare(noisy);
    // Prevent optimizing out
    BM_CHECK(score.ok() && std::move(score).value_() > 0.0);
  }
  state.SetItemsProcessed(size * size * state.iterations());
}

BENCHMARK(BM_EvaluatorCreate)->Range(64, 1024);
BENCHMARK(BM_EvaluatorCompare)->Range(64, 1024);

}  // namespace
}  // namespace pio
