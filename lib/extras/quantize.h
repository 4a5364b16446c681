// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_QUANTIZE_H_
#define LIB_EXTRAS_QUANTIZE_H_

// Palette quantization: median cut palette selection followed by an optional
// Floyd-Steinberg error diffusion while mapping pixels to the palette.

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

using PaletteColor = std::array<uint8_t, 4>;

struct PaletteImage {
  size_t xsize = 0;
  size_t ysize = 0;
  // RGBA entries. Entries with alpha below 255 come first so that the tRNS
  // chunk only has to cover the first "num_transparent" entries; within each
  // group entries are sorted by decreasing popularity.
  std::vector<PaletteColor> palette;
  size_t num_transparent = 0;
  // One palette index per pixel, row by row.
  std::vector<uint8_t> indices;
};

// Reduces "image" to at most "max_colors" (2-256) colors. Images with no more
// distinct colors than that are mapped exactly.
StatusOr<PaletteImage> Quantize(const PackedImage& image, size_t max_colors,
                                bool dither);

// Expands a palette image back to RGB, or RGBA if the palette has
// transparent entries.
StatusOr<PackedImage> ExpandPalette(const PaletteImage& image);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_QUANTIZE_H_
