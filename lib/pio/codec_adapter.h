// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_CODEC_ADAPTER_H_
#define LIB_PIO_CODEC_ADAPTER_H_

// Uniform view of an output format for the search: an integer parameter in a
// bounded native range, an encoder and a decoder for its own output.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/packed_image.h"

namespace pio {

enum class Format : uint32_t {
  kJPEG = 0,
  kPNG = 1,
  kWebP = 2,
};

// Lower case name, also used as file extension: "jpeg", "png" or "webp".
const char* FormatName(Format format);

bool FormatSupportsAlpha(Format format);

// Inclusive range of native parameter values.
struct ParamRange {
  int min;
  int max;

  bool Contains(int parameter) const {
    return parameter >= min && parameter <= max;
  }
  int Clamp(int parameter) const {
    return parameter < min ? min : (parameter > max ? max : parameter);
  }
};

// JPEG and WebP: quality 0..100. PNG: number of palette colors 2..256.
ParamRange NativeRange(Format format);

// Encodes "image" at "parameter" into "bytes". Fails with
// StatusCode::kEncodeError if the parameter is outside the native range or the
// image can not be represented in the format.
using EncodeFunc = std::function<Status(
    const PackedImage& image, int parameter, std::vector<uint8_t>* bytes)>;

// Decodes the output of the matching EncodeFunc. Fails with
// StatusCode::kDecodeError on malformed input.
using DecodeFunc =
    std::function<StatusOr<PackedImage>(const std::vector<uint8_t>& bytes)>;

// Capability record of one output format. The search only uses these four
// members, so tests can substitute in-memory fakes for real codecs.
struct CodecAdapter {
  Format format;
  ParamRange native_range;
  EncodeFunc encode;
  DecodeFunc decode;
};

}  // namespace pio

#endif  // LIB_PIO_CODEC_ADAPTER_H_
