// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_QUALITY_TABLE_H_
#define LIB_PIO_QUALITY_TABLE_H_

// Mapping from operator quality (0..100) to a dissimilarity target and to the
// native parameter of each format.
//
// The tables are measured offline with tools/quality_table_main.cc over a
// reference corpus and embedded as constant data.

#include <cstddef>

#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/optimize_params.h"

namespace pio {

struct QualityTableEntry {
  int quality;
  double target_score;
  int native_param;
};

// Sampling step of the tables in operator quality units.
constexpr int kQualityTableStep = 5;
constexpr size_t kQualityTableSize = 100 / kQualityTableStep + 1;

// Entries sorted by increasing quality, from 0 to 100.
const QualityTableEntry* GetQualityTable(Format format);

// Linear interpolation of the target score; qualities outside [0, 100] clamp
// to the nearest end of the table.
double InterpolateTargetScore(Format format, double quality);

// Linear interpolation of the native parameter, rounded to the nearest
// integer and clamped to the native range of the format.
int NearestNativeParam(Format format, double quality);

// Search bounds of one format for one run.
struct QualityTarget {
  double target_score;
  int min_param;
  int max_param;
};

// Derives the target and the native band from the operator settings. The band
// is [native(quality - spread), native(quality + spread)] clamped to
// "native_range". Setting either explicit bound in "params" drops the derived
// band: the band becomes [min_param, max_param] with an unset side taken from
// "native_range". Fails if the resulting band is empty.
StatusOr<QualityTarget> DeriveQualityTarget(Format format,
                                            const ParamRange& native_range,
                                            const OptimizeParams& params);

}  // namespace pio

#endif  // LIB_PIO_QUALITY_TABLE_H_
