// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_JPG_H_
#define LIB_EXTRAS_CODEC_JPG_H_

// Encodes and decodes JPEG files with libjpeg.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/extras/decoded_file.h"
#include "lib/pio/base/status.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

bool IsJPG(const uint8_t* data, size_t size);

// Decodes a JPEG file to RGB samples, together with its ICC profile and EXIF
// metadata. Grayscale JPEGs are expanded to RGB. CMYK JPEGs are converted to
// sRGB with their profile, which is then dropped from "file". Fails with
// StatusCode::kDecodeError on malformed input.
Status DecodeImageJPG(const std::vector<uint8_t>& bytes, DecodedFile* file);

// Encodes an RGB image at "quality" (0-100) with optimized Huffman tables.
// Gray images produce a single channel JPEG. Fails with
// StatusCode::kEncodeError if the quality is out of range or the image has an
// alpha channel or no pixels.
Status EncodeImageJPG(const PackedImage& image, int quality,
                      const JpegOptions& options, std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_CODEC_JPG_H_
