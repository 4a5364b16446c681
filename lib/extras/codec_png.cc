// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_png.h"

#include <png.h>

#include <cstring>
#include <utility>
#include <vector>

#include "lib/extras/quantize.h"

namespace pio {
namespace extras {

namespace {

constexpr uint8_t kPngSignature[8] = {137, 'P', 'N', 'G', '\r', '\n', 26, '\n'};

struct ReadState {
  const uint8_t* data;
  size_t size;
  size_t pos;
};

void ReadFromMemory(png_structp png_ptr, png_bytep out, png_size_t length) {
  ReadState* state = static_cast<ReadState*>(png_get_io_ptr(png_ptr));
  if (length > state->size - state->pos) {
    png_error(png_ptr, "unexpected end of data");
  }
  memcpy(out, state->data + state->pos, length);
  state->pos += length;
}

void WriteToVector(png_structp png_ptr, png_bytep data, png_size_t length) {
  std::vector<uint8_t>* out =
      static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png_ptr));
  out->insert(out->end(), data, data + length);
}

void FlushNothing(png_structp /*png_ptr*/) {}

void MyErrorFn(png_structp png_ptr, png_const_charp error_msg) {
  PIO_WARNING("libpng error: %s", error_msg);
  png_longjmp(png_ptr, 1);
}

void MyWarningFn(png_structp /*png_ptr*/, png_const_charp warning_msg) {
  PIO_WARNING("libpng warning: %s", warning_msg);
}

int BitDepthForPalette(size_t num_colors) {
  if (num_colors <= 2) return 1;
  if (num_colors <= 4) return 2;
  if (num_colors <= 16) return 4;
  return 8;
}

}  // namespace

bool IsPNG(const uint8_t* data, size_t size) {
  return size >= sizeof(kPngSignature) &&
         memcmp(data, kPngSignature, sizeof(kPngSignature)) == 0;
}

Status DecodeImagePNG(const std::vector<uint8_t>& bytes, DecodedFile* file) {
  if (!IsPNG(bytes.data(), bytes.size())) {
    return PIO_STATUS(StatusCode::kDecodeError, "not a PNG file");
  }
  png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr,
                                               &MyErrorFn, &MyWarningFn);
  if (png_ptr == nullptr) return PIO_FAILURE("png_create_read_struct failed");
  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (info_ptr == nullptr) {
    png_destroy_read_struct(&png_ptr, nullptr, nullptr);
    return PIO_FAILURE("png_create_info_struct failed");
  }

  // Declared before setjmp() because they have non-trivial destructors.
  std::vector<uint8_t> pixels;
  std::vector<png_bytep> rows;
  std::vector<uint8_t> icc;
  std::vector<uint8_t> exif;
  ReadState state = {bytes.data(), bytes.size(), 0};
  size_t xsize = 0;
  size_t ysize = 0;
  size_t nc = 0;

  const auto try_catch_block = [&]() -> bool {
    if (setjmp(png_jmpbuf(png_ptr))) {
      return false;
    }
    png_set_read_fn(png_ptr, &state, &ReadFromMemory);
    png_read_info(png_ptr, info_ptr);
    xsize = png_get_image_width(png_ptr, info_ptr);
    ysize = png_get_image_height(png_ptr, info_ptr);
    const int bit_depth = png_get_bit_depth(png_ptr, info_ptr);
    const int color_type = png_get_color_type(png_ptr, info_ptr);

    png_charp name;
    int compression_type;
    png_bytep profile;
    png_uint_32 proflen;
    if (png_get_iCCP(png_ptr, info_ptr, &name, &compression_type, &profile,
                     &proflen) != 0) {
      icc.assign(profile, profile + proflen);
    }
#ifdef PNG_eXIf_SUPPORTED
    png_bytep exif_data;
    png_uint_32 exif_size;
    if (png_get_eXIf_1(png_ptr, info_ptr, &exif_size, &exif_data) != 0) {
      exif.assign(exif_data, exif_data + exif_size);
    }
#endif

    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) {
      png_set_tRNS_to_alpha(png_ptr);
    }
    if (bit_depth == 16) png_set_strip_16(png_ptr);
    if (bit_depth < 8) png_set_packing(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
      png_set_expand_gray_1_2_4_to_8(png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY ||
        color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
      png_set_gray_to_rgb(png_ptr);
    }
    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);
    nc = png_get_channels(png_ptr, info_ptr);
    if (nc != 3 && nc != 4) {
      png_error(png_ptr, "unexpected number of channels");
    }
    pixels.resize(xsize * ysize * nc);
    rows.resize(ysize);
    for (size_t y = 0; y < ysize; ++y) {
      rows[y] = pixels.data() + y * xsize * nc;
    }
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, info_ptr);
#ifdef PNG_eXIf_SUPPORTED
    // eXIf may also come after the image data.
    if (exif.empty() &&
        png_get_eXIf_1(png_ptr, info_ptr, &exif_size, &exif_data) != 0) {
      exif.assign(exif_data, exif_data + exif_size);
    }
#endif
    return true;
  };

  const bool ok = try_catch_block();
  png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
  if (!ok) {
    return PIO_STATUS(StatusCode::kDecodeError, "failed to decode PNG");
  }
  PIO_ASSIGN_OR_RETURN(file->image, PackedImage::FromPixels(
                                        xsize, ysize, nc, std::move(pixels)));
  file->icc = std::move(icc);
  file->exif = std::move(exif);
  file->format = Format::kPNG;
  return true;
}

Status EncodeImagePNG(const PackedImage& image, int num_colors,
                      const PngOptions& options, std::vector<uint8_t>* bytes) {
  if (num_colors < 2 || num_colors > 256) {
    return PIO_STATUS(StatusCode::kEncodeError,
                      "please specify 2-256 PNG colors, got %d", num_colors);
  }
  if (image.xsize() == 0 || image.ysize() == 0 ||
      image.xsize() > static_cast<size_t>(PNG_USER_WIDTH_MAX) ||
      image.ysize() > static_cast<size_t>(PNG_USER_HEIGHT_MAX)) {
    return PIO_STATUS(StatusCode::kEncodeError, "invalid PNG size %zux%zu",
                      image.xsize(), image.ysize());
  }
  StatusOr<PaletteImage> quantized =
      Quantize(image, static_cast<size_t>(num_colors), options.dither);
  if (!quantized.ok()) {
    return PIO_STATUS(StatusCode::kEncodeError, "quantization failed");
  }
  const PaletteImage palette_image = std::move(quantized).value_();

  png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr,
                                                &MyErrorFn, &MyWarningFn);
  if (png_ptr == nullptr) return PIO_FAILURE("png_create_write_struct failed");
  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (info_ptr == nullptr) {
    png_destroy_write_struct(&png_ptr, nullptr);
    return PIO_FAILURE("png_create_info_struct failed");
  }

  // Declared before setjmp() because they have non-trivial destructors.
  std::vector<uint8_t> out;
  std::vector<png_color> palette(palette_image.palette.size());
  std::vector<png_byte> trans(palette_image.num_transparent);
  std::vector<png_bytep> rows(palette_image.ysize);

  const auto try_catch_block = [&]() -> bool {
    if (setjmp(png_jmpbuf(png_ptr))) {
      return false;
    }
    png_set_write_fn(png_ptr, &out, &WriteToVector, &FlushNothing);
    png_set_compression_level(png_ptr, 9);
    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(image.xsize()),
                 static_cast<png_uint_32>(image.ysize()),
                 BitDepthForPalette(palette.size()), PNG_COLOR_TYPE_PALETTE,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    for (size_t i = 0; i < palette.size(); ++i) {
      palette[i].red = palette_image.palette[i][0];
      palette[i].green = palette_image.palette[i][1];
      palette[i].blue = palette_image.palette[i][2];
    }
    png_set_PLTE(png_ptr, info_ptr, palette.data(),
                 static_cast<int>(palette.size()));
    if (!trans.empty()) {
      for (size_t i = 0; i < trans.size(); ++i) {
        trans[i] = palette_image.palette[i][3];
      }
      png_set_tRNS(png_ptr, info_ptr, trans.data(),
                   static_cast<int>(trans.size()), nullptr);
    }
    // The pixels are sRGB by the time they are quantized.
    png_set_sRGB_gAMA_and_cHRM(png_ptr, info_ptr, PNG_sRGB_INTENT_PERCEPTUAL);
    png_write_info(png_ptr, info_ptr);
    // One index per byte in memory, packed to the bit depth by libpng.
    png_set_packing(png_ptr);
    for (size_t y = 0; y < palette_image.ysize; ++y) {
      rows[y] = const_cast<png_bytep>(palette_image.indices.data() +
                                      y * palette_image.xsize);
    }
    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    return true;
  };

  const bool ok = try_catch_block();
  png_destroy_write_struct(&png_ptr, &info_ptr);
  if (!ok) {
    return PIO_STATUS(StatusCode::kEncodeError, "libpng failed to encode");
  }
  *bytes = std::move(out);
  return true;
}

}  // namespace extras
}  // namespace pio
