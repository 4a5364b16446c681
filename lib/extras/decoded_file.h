// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_DECODED_FILE_H_
#define LIB_EXTRAS_DECODED_FILE_H_

#include <cstdint>
#include <vector>

#include "lib/pio/codec_adapter.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

// Pixels of an input file together with the metadata that still has to be
// applied to them before the search.
struct DecodedFile {
  // RGB or RGBA samples in the color space described by "icc".
  PackedImage image;
  // The embedded ICC profile, empty if the file has none (sRGB).
  std::vector<uint8_t> icc;
  // TIFF structure of the EXIF metadata (starting at the byte order mark),
  // empty if the file has none.
  std::vector<uint8_t> exif;
  Format format = Format::kJPEG;
};

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_DECODED_FILE_H_
