// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_WEBP_H_
#define LIB_EXTRAS_CODEC_WEBP_H_

// Encodes lossy WebP files and decodes WebP files with libwebp.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/extras/decoded_file.h"
#include "lib/pio/base/status.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

bool IsWebP(const uint8_t* data, size_t size);

// Decodes a WebP file to RGB, or RGBA if it has an alpha channel, together
// with its ICCP and EXIF chunks. Fails with StatusCode::kDecodeError on
// malformed input.
Status DecodeImageWebP(const std::vector<uint8_t>& bytes, DecodedFile* file);

// Encodes "image" as lossy WebP at "quality" (0-100), keeping alpha. Fails
// with StatusCode::kEncodeError if the quality is out of range or the image
// is empty or larger than 16383 pixels in either dimension.
Status EncodeImageWebP(const PackedImage& image, int quality,
                       const WebPOptions& options,
                       std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_CODEC_WEBP_H_
