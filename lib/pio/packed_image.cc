// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/packed_image.h"

#include <cstdint>
#include <cstdlib>
#include <utility>

namespace pio {

// static
Status PackedImage::ValidateGeometry(size_t xsize, size_t ysize,
                                     size_t num_channels) {
  if (num_channels != 3 && num_channels != 4) {
    return PIO_FAILURE("Unsupported number of channels: %zu", num_channels);
  }
  if (ysize != 0 && xsize > SIZE_MAX / num_channels / ysize) {
    return PIO_FAILURE("Image %zux%zu too large", xsize, ysize);
  }
  return true;
}

// static
StatusOr<PackedImage> PackedImage::Create(size_t xsize, size_t ysize,
                                          size_t num_channels) {
  PIO_RETURN_IF_ERROR(ValidateGeometry(xsize, ysize, num_channels));
  PackedImage image(xsize, ysize, num_channels);
  image.pixels_.resize(xsize * ysize * num_channels);
  return image;
}

// static
StatusOr<PackedImage> PackedImage::FromPixels(size_t xsize, size_t ysize,
                                              size_t num_channels,
                                              std::vector<uint8_t>&& pixels) {
  PIO_RETURN_IF_ERROR(ValidateGeometry(xsize, ysize, num_channels));
  if (pixels.size() != xsize * ysize * num_channels) {
    return PIO_FAILURE("Pixel buffer has %zu bytes, expected %zu",
                       pixels.size(), xsize * ysize * num_channels);
  }
  PackedImage image(xsize, ysize, num_channels);
  image.pixels_ = std::move(pixels);
  return image;
}

PackedImage PackedImage::Copy() const {
  PackedImage copy(xsize_, ysize_, num_channels_);
  copy.pixels_ = pixels_;
  return copy;
}

bool PackedImage::IsOpaque() const {
  if (!HasAlpha()) return true;
  for (size_t i = 3; i < pixels_.size(); i += 4) {
    if (pixels_[i] != 255) return false;
  }
  return true;
}

bool PackedImage::IsGray() const {
  for (size_t i = 0; i < pixels_.size(); i += num_channels_) {
    const int r = pixels_[i];
    const int g = pixels_[i + 1];
    const int b = pixels_[i + 2];
    if (std::abs(r - g) > 1 || std::abs(g - b) > 1) return false;
  }
  return true;
}

bool PackedImage::SamePixels(const PackedImage& other) const {
  return xsize_ == other.xsize_ && ysize_ == other.ysize_ &&
         num_channels_ == other.num_channels_ && pixels_ == other.pixels_;
}

}  // namespace pio
