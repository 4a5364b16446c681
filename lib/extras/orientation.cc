// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/orientation.h"

#include <cstring>

namespace pio {
namespace extras {
namespace {

bool ShouldFlipX(Orientation orientation) {
  return (orientation == Orientation::kFlipHorizontal ||
          orientation == Orientation::kRotate180 ||
          orientation == Orientation::kRotate270 ||
          orientation == Orientation::kAntiTranspose);
}
bool ShouldFlipY(Orientation orientation) {
  return (orientation == Orientation::kFlipVertical ||
          orientation == Orientation::kRotate180 ||
          orientation == Orientation::kRotate90 ||
          orientation == Orientation::kAntiTranspose);
}
bool ShouldTranspose(Orientation orientation) {
  return (orientation == Orientation::kTranspose ||
          orientation == Orientation::kRotate90 ||
          orientation == Orientation::kRotate270 ||
          orientation == Orientation::kAntiTranspose);
}

}  // namespace

StatusOr<PackedImage> ApplyOrientation(const PackedImage& image,
                                       Orientation orientation) {
  const uint32_t value = static_cast<uint32_t>(orientation);
  if (value < 1 || value > 8) {
    return PIO_FAILURE("invalid orientation %u", value);
  }
  if (orientation == Orientation::kIdentity) return image.Copy();

  const bool flip_x = ShouldFlipX(orientation);
  const bool flip_y = ShouldFlipY(orientation);
  const bool transpose = ShouldTranspose(orientation);
  const size_t in_xsize = image.xsize();
  const size_t in_ysize = image.ysize();
  const size_t nc = image.num_channels();
  const size_t xsize = transpose ? in_ysize : in_xsize;
  const size_t ysize = transpose ? in_xsize : in_ysize;
  PIO_ASSIGN_OR_RETURN(PackedImage out, PackedImage::Create(xsize, ysize, nc));
  for (size_t y = 0; y < ysize; ++y) {
    uint8_t* row = out.Row(y);
    for (size_t x = 0; x < xsize; ++x) {
      size_t sx = transpose ? y : x;
      size_t sy = transpose ? x : y;
      if (flip_x) sx = in_xsize - 1 - sx;
      if (flip_y) sy = in_ysize - 1 - sy;
      memcpy(row + x * nc, image.ConstRow(sy) + sx * nc, nc);
    }
  }
  return out;
}

}  // namespace extras
}  // namespace pio
