// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_EXIF_H_
#define LIB_EXTRAS_EXIF_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/extras/orientation.h"

namespace pio {
namespace extras {

constexpr uint16_t kExifOrientationTag = 274;

// Strips the "Exif\0\0" identifier that precedes the TIFF structure in JPEG
// APP1 markers (and in some WebP EXIF chunks). Returns the input unchanged if
// there is no identifier.
std::vector<uint8_t> StripExifIdentifier(const uint8_t* data, size_t size);

// Parses the EXIF data just enough to extract the orientation of IFD0.
// Invalid or truncated data, a missing tag or an out of range value all give
// Orientation::kIdentity.
Orientation InterpretExifOrientation(const std::vector<uint8_t>& exif);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_EXIF_H_
