// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_PACKED_IMAGE_H_
#define LIB_PIO_PACKED_IMAGE_H_

// Helper class for storing interleaved 8-bit RGB or RGBA images. This is the
// format exchanged between the decoders, the pre-processing steps, the codec
// adapters and the evaluator.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lib/pio/base/status.h"

namespace pio {

// Class representing an interleaved image with 3 (RGB) or 4 (RGBA) channels
// of 8 bits each. The pixel buffer always holds exactly
// xsize * ysize * num_channels bytes. Images are not modified after they are
// handed to the optimizer; transforms produce a new image.
class PackedImage {
 public:
  static StatusOr<PackedImage> Create(size_t xsize, size_t ysize,
                                      size_t num_channels);

  // Takes ownership of "pixels", which must hold exactly
  // xsize * ysize * num_channels bytes.
  static StatusOr<PackedImage> FromPixels(size_t xsize, size_t ysize,
                                          size_t num_channels,
                                          std::vector<uint8_t>&& pixels);

  PackedImage() = default;
  PackedImage(PackedImage&&) = default;
  PackedImage& operator=(PackedImage&&) = default;
  PackedImage(const PackedImage&) = delete;
  PackedImage& operator=(const PackedImage&) = delete;

  PackedImage Copy() const;

  size_t xsize() const { return xsize_; }
  size_t ysize() const { return ysize_; }
  size_t num_channels() const { return num_channels_; }

  // The number of bytes per row.
  size_t stride() const { return xsize_ * num_channels_; }

  // The interleaved pixels, row by row without padding.
  uint8_t* pixels() { return pixels_.data(); }
  const uint8_t* pixels() const { return pixels_.data(); }
  size_t pixels_size() const { return pixels_.size(); }

  uint8_t* Row(size_t y) { return pixels_.data() + y * stride(); }
  const uint8_t* ConstRow(size_t y) const {
    return pixels_.data() + y * stride();
  }

  bool HasAlpha() const { return num_channels_ == 4; }

  // True if there is no alpha channel or every alpha sample is 255.
  bool IsOpaque() const;

  // True if every pixel has R, G and B within 1 of each other. Such images
  // are written as single channel JPEGs.
  bool IsGray() const;

  // True if both images have the same dimensions, channel count and bytes.
  bool SamePixels(const PackedImage& other) const;

 private:
  PackedImage(size_t xsize, size_t ysize, size_t num_channels)
      : xsize_(xsize), ysize_(ysize), num_channels_(num_channels) {}

  static Status ValidateGeometry(size_t xsize, size_t ysize,
                                 size_t num_channels);

  size_t xsize_ = 0;
  size_t ysize_ = 0;
  size_t num_channels_ = 3;
  std::vector<uint8_t> pixels_;
};

}  // namespace pio

#endif  // LIB_PIO_PACKED_IMAGE_H_
