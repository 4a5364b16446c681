// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_OPTIMIZE_PARAMS_H_
#define LIB_PIO_OPTIMIZE_PARAMS_H_

// Operator facing settings of one optimization run.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/pio/codec_adapter.h"

namespace pio {

enum class ChromaSubsampling : uint32_t {
  k420 = 0,
  k422 = 1,
  k444 = 2,
};

struct JpegOptions {
  ChromaSubsampling chroma_subsampling = ChromaSubsampling::k420;
  // Optimized Huffman tables; costs some speed, never quality.
  bool optimize_coding = true;
};

struct WebPOptions {
  // libwebp effort, 0 (fast) to 6 (slowest, smallest).
  int method = 6;
  bool use_sharp_yuv = true;
};

struct PngOptions {
  // Floyd-Steinberg error diffusion when mapping to the palette.
  bool dither = true;
};

struct BackgroundColor {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
};

struct OptimizeParams {
  // Operator quality, 0 (worst) to 100 (best).
  double quality = 85.0;

  // Half width of the native parameter band around "quality", in operator
  // quality units.
  double spread = 10.0;

  // Dissimilarity target. Negative means derived from "quality".
  double target_score = -1.0;

  // Explicit native parameter band. Negative means derived from "quality" and
  // "spread". Each bound replaces the derived one.
  int min_param = -1;
  int max_param = -1;

  // Candidate output formats, in order of preference for exact ties.
  std::vector<Format> formats = {Format::kJPEG};

  // Maximum number of trials of one format search.
  size_t trial_budget = 8;

  // Wall clock limit of the search in seconds, 0 for none. Checked between
  // rounds of trials.
  double deadline_seconds = 0.0;

  // Color that transparent pixels are composited over for formats without
  // alpha.
  BackgroundColor background;

  JpegOptions jpeg;
  WebPOptions webp;
  PngOptions png;
};

}  // namespace pio

#endif  // LIB_PIO_OPTIMIZE_PARAMS_H_
