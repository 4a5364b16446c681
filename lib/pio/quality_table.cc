// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/quality_table.h"

#include <cmath>

namespace pio {

namespace {

// Provisional tables: the scores are hand-fitted to a smooth curve and the
// JPEG and WebP parameters follow quality one to one. Replace them with the
// CSV output of pio_quality_table (tools/quality_table_main.cc) averaged over
// a reference corpus once one is available.
//
// JPEG: libjpeg quality, 4:2:0, optimized Huffman tables.
constexpr QualityTableEntry kJpegTable[kQualityTableSize] = {
    {0, 0.3000, 0},    {5, 0.2000, 5},    {10, 0.1500, 10},
    {15, 0.1200, 15},  {20, 0.1000, 20},  {25, 0.0860, 25},
    {30, 0.0750, 30},  {35, 0.0670, 35},  {40, 0.0600, 40},
    {45, 0.0540, 45},  {50, 0.0490, 50},  {55, 0.0440, 55},
    {60, 0.0400, 60},  {65, 0.0360, 65},  {70, 0.0320, 70},
    {75, 0.0280, 75},  {80, 0.0240, 80},  {85, 0.0200, 85},
    {90, 0.0150, 90},  {95, 0.0100, 95},  {100, 0.0040, 100},
};

// PNG: palette size, median cut with Floyd-Steinberg dithering.
constexpr QualityTableEntry kPngTable[kQualityTableSize] = {
    {0, 0.2500, 2},    {5, 0.1800, 4},    {10, 0.1400, 6},
    {15, 0.1150, 8},   {20, 0.0950, 12},  {25, 0.0800, 16},
    {30, 0.0700, 20},  {35, 0.0620, 24},  {40, 0.0550, 32},
    {45, 0.0490, 40},  {50, 0.0440, 48},  {55, 0.0390, 64},
    {60, 0.0350, 80},  {65, 0.0310, 96},  {70, 0.0270, 112},
    {75, 0.0235, 128}, {80, 0.0200, 160}, {85, 0.0165, 192},
    {90, 0.0120, 224}, {95, 0.0080, 240}, {100, 0.0030, 256},
};

// WebP: lossy quality, method 6, sharp YUV.
constexpr QualityTableEntry kWebPTable[kQualityTableSize] = {
    {0, 0.2700, 0},    {5, 0.1850, 5},    {10, 0.1400, 10},
    {15, 0.1120, 15},  {20, 0.0930, 20},  {25, 0.0800, 25},
    {30, 0.0700, 30},  {35, 0.0620, 35},  {40, 0.0555, 40},
    {45, 0.0500, 45},  {50, 0.0450, 50},  {55, 0.0405, 55},
    {60, 0.0365, 60},  {65, 0.0330, 65},  {70, 0.0295, 70},
    {75, 0.0260, 75},  {80, 0.0225, 80},  {85, 0.0190, 85},
    {90, 0.0145, 90},  {95, 0.0100, 95},  {100, 0.0050, 100},
};

// Index of the table entry at or below "quality" and the interpolation weight
// of the entry after it.
void LocateQuality(double quality, size_t* index, double* frac) {
  if (!(quality > 0.0)) {
    *index = 0;
    *frac = 0.0;
    return;
  }
  if (quality >= 100.0) {
    *index = kQualityTableSize - 1;
    *frac = 0.0;
    return;
  }
  double pos = quality / kQualityTableStep;
  *index = static_cast<size_t>(std::floor(pos));
  *frac = pos - *index;
}

}  // namespace

const QualityTableEntry* GetQualityTable(Format format) {
  switch (format) {
    case Format::kJPEG:
      return kJpegTable;
    case Format::kPNG:
      return kPngTable;
    case Format::kWebP:
      return kWebPTable;
  }
  return kJpegTable;
}

double InterpolateTargetScore(Format format, double quality) {
  const QualityTableEntry* table = GetQualityTable(format);
  size_t i;
  double frac;
  LocateQuality(quality, &i, &frac);
  if (frac == 0.0) return table[i].target_score;
  return table[i].target_score +
         frac * (table[i + 1].target_score - table[i].target_score);
}

int NearestNativeParam(Format format, double quality) {
  const QualityTableEntry* table = GetQualityTable(format);
  size_t i;
  double frac;
  LocateQuality(quality, &i, &frac);
  double param = table[i].native_param;
  if (frac != 0.0) {
    param += frac * (table[i + 1].native_param - table[i].native_param);
  }
  return NativeRange(format).Clamp(static_cast<int>(std::lround(param)));
}

StatusOr<QualityTarget> DeriveQualityTarget(Format format,
                                            const ParamRange& native_range,
                                            const OptimizeParams& params) {
  if (!std::isfinite(params.quality) || !std::isfinite(params.spread)) {
    return PIO_FAILURE("quality and spread must be finite");
  }
  if (params.spread < 0.0) {
    return PIO_FAILURE("negative spread %f", params.spread);
  }
  if (native_range.min > native_range.max) {
    return PIO_FAILURE("empty native range [%d, %d] for %s", native_range.min,
                       native_range.max, FormatName(format));
  }
  QualityTarget target;
  target.target_score = params.target_score >= 0.0
                            ? params.target_score
                            : InterpolateTargetScore(format, params.quality);
  if (params.min_param >= 0 || params.max_param >= 0) {
    // Explicit bounds replace the derived band; a missing side is open up to
    // the end of the native range.
    target.min_param = native_range.Clamp(
        params.min_param >= 0 ? params.min_param : native_range.min);
    target.max_param = native_range.Clamp(
        params.max_param >= 0 ? params.max_param : native_range.max);
  } else {
    // Larger native parameters mean higher fidelity for every format, so the
    // low end of the band comes from the low end of the quality interval.
    target.min_param = native_range.Clamp(
        NearestNativeParam(format, params.quality - params.spread));
    target.max_param = native_range.Clamp(
        NearestNativeParam(format, params.quality + params.spread));
  }
  if (target.min_param > target.max_param) {
    return PIO_FAILURE("empty parameter band [%d, %d] for %s",
                       target.min_param, target.max_param, FormatName(format));
  }
  PIO_DEBUG_V(1, "%s: target %.5f, band [%d, %d]", FormatName(format),
              target.target_score, target.min_param, target.max_param);
  return target;
}

}  // namespace pio
