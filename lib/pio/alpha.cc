// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/alpha.h"

#include <cstdint>
#include <cstring>

#include "lib/pio/base/compiler_specific.h"
#include "lib/pio/srgb.h"

namespace pio {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

StatusOr<PackedImage> CompositeOverBackground(
    const PackedImage& image, const BackgroundColor& background) {
  if (!image.HasAlpha()) return image.Copy();
  PIO_ASSIGN_OR_RETURN(PackedImage out,
                       PackedImage::Create(image.xsize(), image.ysize(), 3));
  const float bg[3] = {SrgbToLinear(background.r), SrgbToLinear(background.g),
                       SrgbToLinear(background.b)};
  const uint8_t bg8[3] = {background.r, background.g, background.b};
  for (size_t y = 0; y < image.ysize(); ++y) {
    const uint8_t* PIO_RESTRICT row_in = image.ConstRow(y);
    uint8_t* PIO_RESTRICT row_out = out.Row(y);
    for (size_t x = 0; x < image.xsize(); ++x) {
      const uint8_t* pixel = row_in + 4 * x;
      uint8_t* out_pixel = row_out + 3 * x;
      const uint8_t a = pixel[3];
      for (size_t c = 0; c < 3; ++c) {
        if (a == 255) {
          out_pixel[c] = pixel[c];
        } else if (a == 0) {
          out_pixel[c] = bg8[c];
        } else {
          const float alpha = a * (1.0f / 255);
          out_pixel[c] = LinearToSrgb8(SrgbToLinear(pixel[c]) * alpha +
                                       bg[c] * (1.0f - alpha));
        }
      }
    }
  }
  return out;
}

bool ParseBackgroundColor(const char* text, BackgroundColor* background) {
  if (text[0] == '#') text++;
  if (strlen(text) != 6) return false;
  int v[6];
  for (size_t i = 0; i < 6; ++i) {
    v[i] = HexDigit(text[i]);
    if (v[i] < 0) return false;
  }
  background->r = static_cast<uint8_t>(v[0] * 16 + v[1]);
  background->g = static_cast<uint8_t>(v[2] * 16 + v[3]);
  background->b = static_cast<uint8_t>(v[4] * 16 + v[5]);
  return true;
}

}  // namespace pio
