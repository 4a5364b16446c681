// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_ALPHA_H_
#define LIB_PIO_ALPHA_H_

#include "lib/pio/base/status.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"

namespace pio {

// Blends an RGBA image over an opaque background color and returns an RGB
// image. The blend happens in linear light. Images without alpha are copied
// unchanged.
StatusOr<PackedImage> CompositeOverBackground(const PackedImage& image,
                                              const BackgroundColor& background);

// Parses "RRGGBB" (with an optional leading '#') into "background".
bool ParseBackgroundColor(const char* text, BackgroundColor* background);

}  // namespace pio

#endif  // LIB_PIO_ALPHA_H_
