// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_TEST_UTILS_H_
#define LIB_PIO_TEST_UTILS_H_

// Synthetic test images.

#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/packed_image.h"

namespace pio {
namespace test {

inline PackedImage AssertOk(StatusOr<PackedImage> image) {
  PIO_CHECK(image.ok());
  return std::move(image).value_();
}

inline PackedImage MakeSolid(size_t xsize, size_t ysize, uint8_t r, uint8_t g,
                             uint8_t b, int alpha = -1) {
  const size_t nc = alpha < 0 ? 3 : 4;
  PackedImage image = AssertOk(PackedImage::Create(xsize, ysize, nc));
  for (size_t y = 0; y < ysize; ++y) {
    uint8_t* row = image.Row(y);
    for (size_t x = 0; x < xsize; ++x) {
      row[nc * x + 0] = r;
      row[nc * x + 1] = g;
      row[nc * x + 2] = b;
      if (nc == 4) row[nc * x + 3] = static_cast<uint8_t>(alpha);
    }
  }
  return image;
}

// Smooth color ramps with a few sharp edges, similar in spirit to a
// photograph with some structure. Alpha, if any, ramps from 0 to 255 from left
// to right.
inline PackedImage MakeTestImage(size_t xsize, size_t ysize,
                                 size_t num_channels = 3) {
  PackedImage image = AssertOk(PackedImage::Create(xsize, ysize, num_channels));
  for (size_t y = 0; y < ysize; ++y) {
    uint8_t* row = image.Row(y);
    for (size_t x = 0; x < xsize; ++x) {
      uint8_t* p = row + num_channels * x;
      const double fx = static_cast<double>(x) / xsize;
      const double fy = static_cast<double>(y) / ysize;
      const bool in_box = x > xsize / 4 && x < xsize / 2 && y > ysize / 3 &&
                          y < 2 * ysize / 3;
      p[0] = static_cast<uint8_t>(255 * fx);
      p[1] = static_cast<uint8_t>(127.5 + 127.5 * std::sin(6.0 * fy + 3 * fx));
      p[2] = in_box ? 20 : static_cast<uint8_t>(255 * (1.0 - fy));
      if (num_channels == 4) {
        p[3] = static_cast<uint8_t>(xsize > 1 ? 255 * x / (xsize - 1) : 255);
      }
    }
  }
  return image;
}

// Adds uniform noise in [-amplitude, amplitude] to the color channels.
inline PackedImage AddNoise(const PackedImage& image, int amplitude,
                            uint32_t seed) {
  PackedImage out = image.Copy();
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(-amplitude, amplitude);
  const size_t nc = out.num_channels();
  for (size_t y = 0; y < out.ysize(); ++y) {
    uint8_t* row = out.Row(y);
    for (size_t x = 0; x < out.xsize(); ++x) {
      for (size_t c = 0; c < 3; ++c) {
        int v = row[nc * x + c] + dist(rng);
        row[nc * x + c] = static_cast<uint8_t>(v < 0 ? 0 : (v > 255 ? 255 : v));
      }
    }
  }
  return out;
}

// Fraction of consecutive entries of "scores" that do not increase by more
// than "tolerance".
inline double FractionNonIncreasing(const std::vector<double>& scores,
                                    double tolerance) {
  if (scores.size() < 2) return 1.0;
  size_t ok = 0;
  for (size_t i = 1; i < scores.size(); ++i) {
    if (scores[i] <= scores[i - 1] + tolerance) ++ok;
  }
  return static_cast<double>(ok) / (scores.size() - 1);
}

// In-memory lossy codec for tests of the search. Parameters at or above
// "exact_from" reproduce the image exactly; lower parameters brighten every
// color sample by 8 levels per step below "exact_from". The encoded size is
// a small header plus the raw pixels plus padding(parameter) bytes.
struct FakeCodecOptions {
  int exact_from = 0;
  std::function<size_t(int)> padding = [](int parameter) {
    return static_cast<size_t>(parameter) * 8;
  };
  bool fail_encode = false;
  // Encoded data is truncated, so decoding fails.
  bool corrupt_output = false;
  // Decoded images are one pixel narrower than the source.
  bool wrong_size = false;
  // Incremented on every encode call, if set.
  std::shared_ptr<std::atomic<int>> num_encodes;
  // Appended with every encoded parameter, if set. Only for single-threaded
  // use.
  std::shared_ptr<std::vector<int>> parameters;
};

constexpr size_t kFakeHeaderSize = 9;

inline CodecAdapter MakeFakeAdapter(Format format, ParamRange native_range,
                                    const FakeCodecOptions& options) {
  CodecAdapter adapter;
  adapter.format = format;
  adapter.native_range = native_range;
  adapter.encode = [options](const PackedImage& image, int parameter,
                             std::vector<uint8_t>* bytes) -> Status {
    if (options.num_encodes) (*options.num_encodes)++;
    if (options.parameters) options.parameters->push_back(parameter);
    if (options.fail_encode) {
      return PIO_STATUS(StatusCode::kEncodeError, "fake encoder failure");
    }
    const size_t xsize = image.xsize() - (options.wrong_size ? 1 : 0);
    const size_t nc = image.num_channels();
    bytes->clear();
    for (int i = 0; i < 4; ++i) bytes->push_back((xsize >> (8 * i)) & 0xFF);
    for (int i = 0; i < 4; ++i) {
      bytes->push_back((image.ysize() >> (8 * i)) & 0xFF);
    }
    bytes->push_back(static_cast<uint8_t>(nc));
    const int offset =
        parameter >= options.exact_from ? 0 : 8 * (options.exact_from - parameter);
    for (size_t y = 0; y < image.ysize(); ++y) {
      const uint8_t* row = image.ConstRow(y);
      for (size_t x = 0; x < xsize; ++x) {
        for (size_t c = 0; c < nc; ++c) {
          int v = row[nc * x + c];
          if (c < 3) v = v + offset > 255 ? 255 : v + offset;
          bytes->push_back(static_cast<uint8_t>(v));
        }
      }
    }
    bytes->resize(bytes->size() + options.padding(parameter));
    if (options.corrupt_output) bytes->resize(kFakeHeaderSize);
    return true;
  };
  adapter.decode =
      [](const std::vector<uint8_t>& bytes) -> StatusOr<PackedImage> {
    if (bytes.size() < kFakeHeaderSize) {
      return PIO_STATUS(StatusCode::kDecodeError, "truncated header");
    }
    size_t xsize = 0;
    size_t ysize = 0;
    for (int i = 0; i < 4; ++i) {
      xsize |= static_cast<size_t>(bytes[i]) << (8 * i);
      ysize |= static_cast<size_t>(bytes[4 + i]) << (8 * i);
    }
    const size_t nc = bytes[8];
    const size_t pixels_size = xsize * ysize * nc;
    if (bytes.size() - kFakeHeaderSize < pixels_size) {
      return PIO_STATUS(StatusCode::kDecodeError, "truncated pixels");
    }
    std::vector<uint8_t> pixels(bytes.begin() + kFakeHeaderSize,
                                bytes.begin() + kFakeHeaderSize + pixels_size);
    StatusOr<PackedImage> image =
        PackedImage::FromPixels(xsize, ysize, nc, std::move(pixels));
    if (!image.ok()) {
      return PIO_STATUS(StatusCode::kDecodeError, "bad geometry");
    }
    return image;
  };
  return adapter;
}

}  // namespace test
}  // namespace pio

#endif  // LIB_PIO_TEST_UTILS_H_
