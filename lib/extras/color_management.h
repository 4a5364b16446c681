// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_COLOR_MANAGEMENT_H_
#define LIB_EXTRAS_COLOR_MANAGEMENT_H_

// Conversion of decoded pixels with an embedded ICC profile to sRGB, using
// lcms2 with the perceptual rendering intent.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

// True if a profile with this description is a variant of sRGB, which covers
// the short names used by common compact sRGB profiles.
bool IsSrgbDescription(const std::string& description);

// Returns the ASCII description of the profile, or an error if the profile
// can not be parsed.
StatusOr<std::string> ProfileDescription(const std::vector<uint8_t>& icc);

// Returns "image" converted from the RGB or grayscale color space described
// by "icc" to sRGB. Alpha is kept unchanged. An empty, sRGB or unreadable
// profile returns a copy of "image"; unreadable profiles are reported with a
// warning only.
StatusOr<PackedImage> ConvertToSrgb(const std::vector<uint8_t>& icc,
                                    const PackedImage& image);

// Converts interleaved CMYK samples to an sRGB image. A CMYK profile is
// required. "inverted" is set for Adobe style samples where 0 means full ink.
StatusOr<PackedImage> ConvertCmykToSrgb(const std::vector<uint8_t>& icc,
                                        const uint8_t* cmyk, size_t xsize,
                                        size_t ysize, bool inverted);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_COLOR_MANAGEMENT_H_
