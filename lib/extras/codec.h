// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_H_
#define LIB_EXTRAS_CODEC_H_

// Facade for the image codecs: format detection, decoding of input files into
// the sRGB image the optimizer works on, and codec adapters for the search.

#include <cstdint>
#include <string>
#include <vector>

#include "lib/extras/decoded_file.h"
#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/optimize_params.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace extras {

// Detects the format from the magic bytes. Returns false if unknown.
bool DetectFormat(const std::vector<uint8_t>& bytes, Format* format);

// Detects the format from the file extension, ignoring case. Returns false
// if unknown.
bool FormatFromPath(const std::string& path, Format* format);

// Parses a format name: "jpeg", "jpg", "png" or "webp", ignoring case.
bool ParseFormat(const std::string& name, Format* format);

// Parses a comma separated list of format names. Duplicates are dropped,
// keeping the first occurrence.
Status ParseFormatList(const std::string& list, std::vector<Format>* formats);

// Decodes an input file without any post-processing.
Status DecodeBytes(const std::vector<uint8_t>& bytes, DecodedFile* file);

// Decodes an input file, converts it to sRGB and applies its EXIF
// orientation. This is the image the optimizer compares candidates against.
StatusOr<PackedImage> DecodeToSrgb(const std::vector<uint8_t>& bytes,
                                   Format* orig_format);

// Returns the adapter that encodes to "format" with the codec options of
// "params".
CodecAdapter MakeCodecAdapter(Format format, const OptimizeParams& params);

// One adapter per entry of params.formats, in order.
std::vector<CodecAdapter> MakeCodecAdapters(const OptimizeParams& params);

}  // namespace extras
}  // namespace pio

#endif  // LIB_EXTRAS_CODEC_H_
