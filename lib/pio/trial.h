// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_TRIAL_H_
#define LIB_PIO_TRIAL_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/pio/codec_adapter.h"

namespace pio {

// One encode, decode and evaluate cycle.
struct Trial {
  Format format = Format::kJPEG;
  int parameter = 0;
  std::vector<uint8_t> encoded;
  double score = 0.0;
};

// Outcome of the search: the winning trial plus the context it was chosen in.
struct SearchResult {
  Format format = Format::kJPEG;
  int parameter = 0;
  std::vector<uint8_t> encoded;
  double score = 0.0;
  double target_score = 0.0;
  // Whether "score" is within the target. If false, the result is the trial
  // closest to the target.
  bool satisfies_target = false;
  // Number of trials of the format search that produced this result.
  size_t num_trials = 0;
};

}  // namespace pio

#endif  // LIB_PIO_TRIAL_H_
