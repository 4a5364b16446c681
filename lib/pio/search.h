// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_SEARCH_H_
#define LIB_PIO_SEARCH_H_

// Bounded bisection over the native parameter band of each candidate format,
// followed by the selection of the winner across formats.
//
// The bisection assumes that the score decreases as the native parameter
// grows. Encoders only roughly behave that way, so the search is a heuristic:
// it returns the best trial it saw within the band and the trial budget, not
// a proven optimum.

#include <cstddef>
#include <functional>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/packed_image.h"
#include "lib/pio/quality_table.h"
#include "lib/pio/trial.h"
#include "lib/pio/trial_scheduler.h"

namespace pio {

// One candidate format of a run. "image" is the source as this format encodes
// it (composited over the background for formats without alpha) and
// "evaluator" was created from the same image. Both are borrowed.
struct FormatCandidate {
  CodecAdapter adapter;
  QualityTarget target;
  const PackedImage* image;
  const Evaluator* evaluator;
};

// Progress hook, called with each trial outcome and the target of its format.
using TrialCallback =
    std::function<void(const TrialOutcome& outcome, const QualityTarget& target)>;

struct SearchOptions {
  // Maximum number of trials of one format.
  size_t trial_budget = 8;

  // Wall clock limit in seconds, 0 for none. The first round always runs.
  double deadline_seconds = 0.0;

  // If set, called on the calling thread after each trial.
  TrialCallback on_trial;
};

// Whether "a" should replace "b" as the best result: any result within its
// target beats any result outside it; among results within target the
// smaller one wins, and equal sizes prefer the lower score; among results
// outside target the one with the smaller excess over its target wins. Ties
// return false, so the earlier result is kept.
bool IsBetterResult(const SearchResult& a, const SearchResult& b);

// Searches every candidate and returns the overall winner. Formats whose
// trials fail to decode or decode to a wrong size are dropped, as are formats
// without a single scored trial; if every format is dropped the search fails
// with StatusCode::kNoViableEncoding.
//
// If "per_format" is not null, it receives the result of every format that
// was not dropped, in candidate order.
StatusOr<SearchResult> SearchBestEncoding(
    const std::vector<FormatCandidate>& candidates,
    const SearchOptions& options, TrialScheduler* scheduler,
    std::vector<SearchResult>* per_format = nullptr);

}  // namespace pio

#endif  // LIB_PIO_SEARCH_H_
