// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_webp.h"

#include <webp/decode.h>
#include <webp/demux.h>
#include <webp/encode.h>

#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "lib/extras/exif.h"

namespace pio {
namespace extras {

namespace {

int WebPVectorWrite(const uint8_t* data, size_t data_size,
                    const WebPPicture* const picture) {
  if (data_size) {
    std::vector<uint8_t>* const out =
        static_cast<std::vector<uint8_t>*>(picture->custom_ptr);
    const size_t pos = out->size();
    out->resize(pos + data_size);
    memcpy(out->data() + pos, data, data_size);
  }
  return 1;
}

struct DemuxDeleter {
  void operator()(WebPDemuxer* p) { WebPDemuxDelete(p); }
};

// Copies the first chunk with the given fourcc, if any.
void ReadChunk(WebPDemuxer* demux, const char* fourcc,
               std::vector<uint8_t>* out) {
  WebPChunkIterator iter;
  if (WebPDemuxGetChunk(demux, fourcc, 1, &iter)) {
    out->assign(iter.chunk.bytes, iter.chunk.bytes + iter.chunk.size);
    WebPDemuxReleaseChunkIterator(&iter);
  }
}

}  // namespace

bool IsWebP(const uint8_t* data, size_t size) {
  return size >= 12 && memcmp(data, "RIFF", 4) == 0 &&
         memcmp(data + 8, "WEBP", 4) == 0;
}

Status DecodeImageWebP(const std::vector<uint8_t>& bytes, DecodedFile* file) {
  if (!IsWebP(bytes.data(), bytes.size())) {
    return PIO_STATUS(StatusCode::kDecodeError, "not a WebP file");
  }
  WebPDecoderConfig config;
  if (!WebPInitDecoderConfig(&config)) {
    return PIO_FAILURE("WebPInitDecoderConfig failed");
  }
  if (WebPGetFeatures(bytes.data(), bytes.size(), &config.input) !=
      VP8_STATUS_OK) {
    return PIO_STATUS(StatusCode::kDecodeError, "invalid WebP header");
  }
  if (config.input.has_animation) {
    return PIO_STATUS(StatusCode::kDecodeError, "animated WebP");
  }
  const size_t xsize = config.input.width;
  const size_t ysize = config.input.height;
  const size_t nc = config.input.has_alpha ? 4 : 3;
  PIO_ASSIGN_OR_RETURN(PackedImage image,
                       PackedImage::Create(xsize, ysize, nc));

  config.options.use_threads = 0;
  config.options.dithering_strength = 0;
  config.options.bypass_filtering = 0;
  config.options.no_fancy_upsampling = 0;
  WebPDecBuffer* const buf = &config.output;
  buf->colorspace = nc == 4 ? MODE_RGBA : MODE_RGB;
  buf->is_external_memory = 1;
  buf->u.RGBA.rgba = image.pixels();
  buf->u.RGBA.stride = static_cast<int>(image.stride());
  buf->u.RGBA.size = image.pixels_size();
  const VP8StatusCode status = WebPDecode(bytes.data(), bytes.size(), &config);
  WebPFreeDecBuffer(buf);
  if (status != VP8_STATUS_OK) {
    return PIO_STATUS(StatusCode::kDecodeError, "WebPDecode failed: %d",
                      static_cast<int>(status));
  }

  std::vector<uint8_t> icc;
  std::vector<uint8_t> exif;
  WebPData webp_data = {bytes.data(), bytes.size()};
  std::unique_ptr<WebPDemuxer, DemuxDeleter> demux(WebPDemux(&webp_data));
  if (demux) {
    const uint32_t flags = WebPDemuxGetI(demux.get(), WEBP_FF_FORMAT_FLAGS);
    if (flags & ICCP_FLAG) ReadChunk(demux.get(), "ICCP", &icc);
    if (flags & EXIF_FLAG) {
      std::vector<uint8_t> raw;
      ReadChunk(demux.get(), "EXIF", &raw);
      exif = StripExifIdentifier(raw.data(), raw.size());
    }
  } else {
    PIO_WARNING("Ignoring unreadable WebP metadata");
  }

  file->image = std::move(image);
  file->icc = std::move(icc);
  file->exif = std::move(exif);
  file->format = Format::kWebP;
  return true;
}

Status EncodeImageWebP(const PackedImage& image, int quality,
                       const WebPOptions& options,
                       std::vector<uint8_t>* bytes) {
  if (quality < 0 || quality > 100) {
    return PIO_STATUS(StatusCode::kEncodeError,
                      "please specify a 0-100 WebP quality, got %d", quality);
  }
  // WebP encoding fails if the image is more than 16383 pixels high or wide.
  if (image.xsize() == 0 || image.ysize() == 0 ||
      image.xsize() > static_cast<size_t>(WEBP_MAX_DIMENSION) ||
      image.ysize() > static_cast<size_t>(WEBP_MAX_DIMENSION)) {
    return PIO_STATUS(StatusCode::kEncodeError, "invalid WebP size %zux%zu",
                      image.xsize(), image.ysize());
  }
  WebPConfig config;
  if (!WebPConfigInit(&config)) {
    return PIO_FAILURE("WebPConfigInit failed");
  }
  config.lossless = 0;
  config.quality = static_cast<float>(quality);
  config.method = options.method;
#if WEBP_ENCODER_ABI_VERSION >= 0x020e
  config.use_sharp_yuv = options.use_sharp_yuv ? 1 : 0;
#else
  if (options.use_sharp_yuv) {
    PIO_WARNING("Sharp YUV not supported by this WebP version");
  }
#endif
  if (!WebPValidateConfig(&config)) {
    return PIO_STATUS(StatusCode::kEncodeError, "invalid WebP configuration");
  }

  std::vector<uint8_t> out;
  WebPPicture pic;
  if (!WebPPictureInit(&pic)) {
    return PIO_FAILURE("WebPPictureInit failed");
  }
  pic.width = static_cast<int>(image.xsize());
  pic.height = static_cast<int>(image.ysize());
  pic.writer = &WebPVectorWrite;
  // Sharp YUV conversion happens inside WebPEncode, from ARGB samples.
  if (options.use_sharp_yuv) pic.use_argb = 1;
  pic.custom_ptr = &out;

  const int stride = static_cast<int>(image.stride());
  const int imported = image.HasAlpha()
                           ? WebPPictureImportRGBA(&pic, image.pixels(), stride)
                           : WebPPictureImportRGB(&pic, image.pixels(), stride);
  if (!imported) {
    WebPPictureFree(&pic);
    return PIO_STATUS(StatusCode::kEncodeError, "WebPPictureImport failed");
  }

  const bool ok = WebPEncode(&config, &pic) != 0;
  const int error_code = pic.error_code;
  WebPPictureFree(&pic);
  if (!ok) {
    return PIO_STATUS(StatusCode::kEncodeError, "WebPEncode failed: %d",
                      error_code);
  }
  *bytes = std::move(out);
  return true;
}

}  // namespace extras
}  // namespace pio
