// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/optimize.h"

#include <memory>
#include <utility>

#include "lib/pio/alpha.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/quality_table.h"
#include "lib/pio/trial_scheduler.h"

namespace pio {

StatusOr<SearchResult> Optimize(
    const PackedImage& image, const std::vector<CodecAdapter>& adapters,
    const OptimizeParams& params, ThreadPool* pool,
    const TrialCallback& on_trial,
    std::vector<SearchResult>* per_format) {
  if (adapters.empty()) {
    return PIO_FAILURE("no output formats");
  }
  if (image.xsize() == 0 || image.ysize() == 0) {
    return PIO_FAILURE("empty image");
  }

  // An alpha channel that is fully opaque carries no information; dropping it
  // lets every format share one source and one evaluator.
  PackedImage source;
  if (image.HasAlpha() && image.IsOpaque()) {
    PIO_ASSIGN_OR_RETURN(source,
                         CompositeOverBackground(image, params.background));
  } else {
    source = image.Copy();
  }

  bool needs_flat = false;
  for (const CodecAdapter& adapter : adapters) {
    if (source.HasAlpha() && !FormatSupportsAlpha(adapter.format)) {
      needs_flat = true;
    }
  }
  PackedImage flat;
  std::unique_ptr<Evaluator> flat_evaluator;
  if (needs_flat) {
    PIO_ASSIGN_OR_RETURN(flat,
                         CompositeOverBackground(source, params.background));
    PIO_ASSIGN_OR_RETURN(Evaluator evaluator, Evaluator::Create(flat));
    flat_evaluator = std::make_unique<Evaluator>(std::move(evaluator));
  }
  PIO_ASSIGN_OR_RETURN(Evaluator source_evaluator, Evaluator::Create(source));

  std::vector<FormatCandidate> candidates;
  candidates.reserve(adapters.size());
  for (const CodecAdapter& adapter : adapters) {
    PIO_ASSIGN_OR_RETURN(
        QualityTarget target,
        DeriveQualityTarget(adapter.format, adapter.native_range, params));
    const bool use_flat =
        source.HasAlpha() && !FormatSupportsAlpha(adapter.format);
    candidates.push_back(FormatCandidate{
        adapter, target, use_flat ? &flat : &source,
        use_flat ? flat_evaluator.get() : &source_evaluator});
  }

  SearchOptions options;
  options.trial_budget = params.trial_budget;
  options.deadline_seconds = params.deadline_seconds;
  options.on_trial = on_trial;
  TrialScheduler scheduler(pool);
  return SearchBestEncoding(candidates, options, &scheduler, per_format);
}

}  // namespace pio
