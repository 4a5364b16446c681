// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_EVALUATOR_H_
#define LIB_PIO_EVALUATOR_H_

// Perceptual dissimilarity between a source image and a re-decoded candidate.
//
// The metric is SSIMULACRA: a multi-scale structural similarity computed in
// CIE Lab on linear sRGB samples, extended with an edge-difference map and a
// penalty for the worst rows and columns of the similarity maps. The score is
// 0 for pixel-identical images and grows as the candidate degrades; typical
// visually lossless encodes score below 0.01.

#include <cstddef>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/image.h"
#include "lib/pio/packed_image.h"

namespace pio {

// Per-scale and per-channel statistics of one comparison.
struct SsimulacraScale {
  double avg_ssim[3];
  double min_ssim[3];
};

struct Ssimulacra {
  std::vector<SsimulacraScale> scales;
  double avg_edgediff[3];
  double row_p2[2][3];
  double col_p2[2][3];

  // Weighted combination of the statistics, clamped to [0, 1].
  double Score() const;
  void PrintDetails() const;
};

// Compares candidates against one source image. The source side of the metric
// (Lab pyramid, local means and variances) is computed once in Create().
// Compare() does not modify the evaluator, so one instance can serve all the
// trials of a batch concurrently.
class Evaluator {
 public:
  static StatusOr<Evaluator> Create(const PackedImage& source);

  Evaluator(Evaluator&&) = default;
  Evaluator& operator=(Evaluator&&) = default;

  // Fails with StatusCode::kDimensionMismatch if the candidate does not have
  // the dimensions of the source.
  StatusOr<double> Compare(const PackedImage& candidate) const;

  // As Compare, but returns all the statistics.
  StatusOr<Ssimulacra> CompareDetailed(const PackedImage& candidate) const;

  size_t xsize() const { return source_.xsize(); }
  size_t ysize() const { return source_.ysize(); }

 private:
  // Source side of one scale of the pyramid.
  struct Scale {
    Image3F lab;
    Image3F mu;
    Image3F sigma_sq;
  };

  Evaluator() = default;

  PackedImage source_;
  std::vector<Scale> scales_;
};

// One-shot comparison of two images of identical dimensions.
StatusOr<double> ComputeDissimilarity(const PackedImage& source,
                                      const PackedImage& candidate);

}  // namespace pio

#endif  // LIB_PIO_EVALUATOR_H_
