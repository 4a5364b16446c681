// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_OPTIMIZE_H_
#define LIB_PIO_OPTIMIZE_H_

// Entry point of the optimizer: from a pre-processed sRGB image to the
// smallest encoding that meets the quality target.

#include <vector>

#include "lib/pio/base/data_parallel.h"
#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"
#include "lib/pio/search.h"
#include "lib/pio/trial.h"

namespace pio {

// Searches every adapter in "adapters", in order of preference, and returns
// the winner. "params.formats" is not consulted; the caller builds one adapter
// per format it wants. Formats without alpha support see "image" composited
// over "params.background". "on_trial" may be empty. "pool" may be null.
//
// If "per_format" is not null, it receives the result of every format that
// was not dropped.
StatusOr<SearchResult> Optimize(
    const PackedImage& image, const std::vector<CodecAdapter>& adapters,
    const OptimizeParams& params, ThreadPool* pool,
    const TrialCallback& on_trial,
    std::vector<SearchResult>* per_format = nullptr);

}  // namespace pio

#endif  // LIB_PIO_OPTIMIZE_H_
