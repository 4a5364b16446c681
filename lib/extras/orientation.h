// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_ORIENTATION_H_
#define LIB_EXTRAS_ORIENTATION_H_

#include <cstdint>

#include "lib/pio/base/status.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

// Values of the EXIF orientation tag. The name describes the transform that
// was applied to the displayed image to obtain the stored pixels.
enum class Orientation : uint32_t {
  kIdentity = 1,
  kFlipHorizontal = 2,
  kRotate180 = 3,
  kFlipVertical = 4,
  kTranspose = 5,
  kRotate90 = 6,
  kAntiTranspose = 7,
  kRotate270 = 8,
};

// Returns the stored pixels of "image" rearranged for display, so that the
// result has orientation kIdentity. Orientations 5 to 8 swap the dimensions.
StatusOr<PackedImage> ApplyOrientation(const PackedImage& image,
                                       Orientation orientation);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_ORIENTATION_H_
