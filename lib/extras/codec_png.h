// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_PNG_H_
#define LIB_EXTRAS_CODEC_PNG_H_

// Encodes palette PNG files and decodes PNG files with libpng.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/extras/decoded_file.h"
#include "lib/pio/base/status.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

bool IsPNG(const uint8_t* data, size_t size);

// Decodes any PNG to 8-bit RGB or RGBA, together with its iCCP profile and
// eXIf metadata. Fails with StatusCode::kDecodeError on malformed input.
Status DecodeImagePNG(const std::vector<uint8_t>& bytes, DecodedFile* file);

// Quantizes "image" to at most "num_colors" (2-256) colors and writes a
// palette PNG with sRGB, gAMA and cHRM chunks. Fails with
// StatusCode::kEncodeError if the palette size is out of range or the image
// has no pixels.
Status EncodeImagePNG(const PackedImage& image, int num_colors,
                      const PngOptions& options, std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_CODEC_PNG_H_
