// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_SRGB_H_
#define LIB_PIO_SRGB_H_

// sRGB transfer function for 8-bit samples.

#include <cstdint>

namespace pio {

// Linear light in [0, 1] of an 8-bit sRGB sample, from a table.
float SrgbToLinear(uint8_t v);

// Nearest 8-bit sRGB sample of a linear value; clamps to [0, 1] first.
uint8_t LinearToSrgb8(float linear);

}  // namespace pio

#endif  // LIB_PIO_SRGB_H_
