// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/progress.h"

#include <stdio.h>

#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/trial.h"

namespace pio {
namespace tools {

double Percent(size_t size, size_t reference) {
  return reference == 0 ? 0.0 : 100.0 * size / reference;
}

std::string TrialLine(const TrialOutcome& outcome, const QualityTarget& target,
                      size_t input_size) {
  char buf[256];
  const Trial& trial = outcome.trial;
  if (!outcome.status) {
    snprintf(buf, sizeof(buf),
             "%s range %d - %d quality %d trial failed (%s)\n",
             FormatName(trial.format), target.min_param, target.max_param,
             trial.parameter, StatusCodeName(outcome.status.code()));
  } else {
    snprintf(buf, sizeof(buf),
             "%s range %d - %d quality %d, SSIM %.6f %zu bytes, %.1f %% of "
             "original\n",
             FormatName(trial.format), target.min_param, target.max_param,
             trial.parameter, trial.score, trial.encoded.size(),
             Percent(trial.encoded.size(), input_size));
  }
  return buf;
}

}  // namespace tools
}  // namespace pio
