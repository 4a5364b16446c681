// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_jpg.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <memory>
#include <numeric>
#include <utility>
#include <vector>

#include "lib/extras/color_management.h"
#include "lib/extras/exif.h"
#include "lib/extras/include_jpeglib.h"  // NOLINT

namespace pio {
namespace extras {

namespace {

constexpr unsigned char kICCSignature[12] = {
    0x49, 0x43, 0x43, 0x5F, 0x50, 0x52, 0x4F, 0x46, 0x49, 0x4C, 0x45, 0x00};
constexpr int kICCMarker = JPEG_APP0 + 2;
constexpr unsigned char kExifSignature[6] = {0x45, 0x78, 0x69,
                                             0x66, 0x00, 0x00};
constexpr int kExifMarker = JPEG_APP0 + 1;

bool MarkerIsICC(const jpeg_saved_marker_ptr marker) {
  return marker->marker == kICCMarker &&
         marker->data_length >= sizeof kICCSignature + 2 &&
         std::equal(std::begin(kICCSignature), std::end(kICCSignature),
                    marker->data);
}

bool MarkerIsExif(const jpeg_saved_marker_ptr marker) {
  return marker->marker == kExifMarker &&
         marker->data_length >= sizeof kExifSignature + 2 &&
         std::equal(std::begin(kExifSignature), std::end(kExifSignature),
                    marker->data);
}

// Leaves "icc" empty if there is no ICC profile. Fails if the chunks are
// inconsistent.
Status ReadICCProfile(jpeg_decompress_struct* const cinfo,
                      std::vector<uint8_t>* const icc) {
  constexpr size_t kICCSignatureSize = sizeof kICCSignature;
  // ICC signature + uint8_t index + uint8_t max_index.
  constexpr size_t kICCHeadSize = kICCSignatureSize + 2;
  // Markers are 1-indexed, and we keep them that way in this vector to get a
  // convenient 0 at the front for when we compute the offsets later.
  std::vector<size_t> marker_lengths;
  int num_markers = 0;
  int seen_markers_count = 0;
  bool has_num_markers = false;
  for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr;
       marker = marker->next) {
    if (!MarkerIsICC(marker)) continue;

    const int current_marker = marker->data[kICCSignatureSize];
    if (current_marker == 0) {
      return PIO_FAILURE("inconsistent JPEG ICC marker numbering");
    }
    const int current_num_markers = marker->data[kICCSignatureSize + 1];
    if (current_marker > current_num_markers) {
      return PIO_FAILURE("inconsistent JPEG ICC marker numbering");
    }
    if (has_num_markers) {
      if (current_num_markers != num_markers) {
        return PIO_FAILURE("inconsistent numbers of JPEG ICC markers");
      }
    } else {
      num_markers = current_num_markers;
      has_num_markers = true;
      marker_lengths.resize(num_markers + 1);
    }

    size_t marker_length = marker->data_length - kICCHeadSize;

    if (marker_length == 0) {
      // NB: if we allow empty chunks, then the next check is incorrect.
      return PIO_FAILURE("Empty ICC chunk");
    }

    if (marker_lengths[current_marker] != 0) {
      return PIO_FAILURE("duplicate JPEG ICC marker number");
    }
    marker_lengths[current_marker] = marker_length;
    seen_markers_count++;
  }

  if (marker_lengths.empty()) {
    // Not an error.
    return true;
  }

  if (seen_markers_count != num_markers) {
    PIO_DASSERT(has_num_markers);
    return PIO_FAILURE("Incomplete set of ICC chunks");
  }

  std::vector<size_t> offsets = std::move(marker_lengths);
  std::partial_sum(offsets.begin(), offsets.end(), offsets.begin());
  icc->resize(offsets.back());

  for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr;
       marker = marker->next) {
    if (!MarkerIsICC(marker)) continue;
    const uint8_t* first = marker->data + kICCHeadSize;
    uint8_t current_marker = marker->data[kICCSignatureSize];
    size_t offset = offsets[current_marker - 1];
    size_t marker_length = offsets[current_marker] - offset;
    std::copy_n(first, marker_length, icc->data() + offset);
  }

  return true;
}

void ReadExif(jpeg_decompress_struct* const cinfo,
              std::vector<uint8_t>* const exif) {
  for (jpeg_saved_marker_ptr marker = cinfo->marker_list; marker != nullptr;
       marker = marker->next) {
    if (!MarkerIsExif(marker)) continue;
    *exif = StripExifIdentifier(marker->data, marker->data_length);
    return;
  }
}

void SetChromaSubsampling(ChromaSubsampling chroma_subsampling,
                          jpeg_compress_struct* const cinfo) {
  // Factors of the luma component, the chroma components are never upsampled.
  int h_samp = 1;
  int v_samp = 1;
  switch (chroma_subsampling) {
    case ChromaSubsampling::k420:
      h_samp = 2;
      v_samp = 2;
      break;
    case ChromaSubsampling::k422:
      h_samp = 2;
      break;
    case ChromaSubsampling::k444:
      break;
  }
  cinfo->comp_info[0].h_samp_factor = h_samp;
  cinfo->comp_info[0].v_samp_factor = v_samp;
  for (size_t i = 1; i < 3; i++) {
    cinfo->comp_info[i].h_samp_factor = 1;
    cinfo->comp_info[i].v_samp_factor = 1;
  }
}

void MyErrorExit(j_common_ptr cinfo) {
  jmp_buf* env = static_cast<jmp_buf*>(cinfo->client_data);
  (*cinfo->err->output_message)(cinfo);
  jpeg_destroy(cinfo);
  longjmp(*env, 1);
}

void MyOutputMessage(j_common_ptr cinfo) {
#if PIO_DEBUG_WARNING == 1
  char buf[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, buf);
  PIO_WARNING("%s", buf);
#endif
}

}  // namespace

bool IsJPG(const uint8_t* data, size_t size) {
  return size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

Status DecodeImageJPG(const std::vector<uint8_t>& bytes, DecodedFile* file) {
  if (!IsJPG(bytes.data(), bytes.size())) {
    return PIO_STATUS(StatusCode::kDecodeError, "not a JPEG file");
  }

  // We need to declare all the non-trivial destructor local variables before
  // the call to setjmp().
  std::vector<uint8_t> icc;
  std::vector<uint8_t> exif;
  std::vector<uint8_t> pixels;
  std::unique_ptr<JSAMPLE[]> row;
  size_t xsize = 0;
  size_t ysize = 0;
  int nbcomp = 0;
  bool inverted_cmyk = false;
  bool icc_error = false;

  const auto try_catch_block = [&]() -> bool {
    jpeg_decompress_struct cinfo;
    // Setup error handling in jpeg library so we can deal with broken jpegs.
    jpeg_error_mgr jerr;
    jmp_buf env;
    cinfo.err = jpeg_std_error(&jerr);
    jerr.error_exit = &MyErrorExit;
    jerr.output_message = &MyOutputMessage;
    if (setjmp(env)) {
      return false;
    }
    cinfo.client_data = static_cast<void*>(&env);

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, reinterpret_cast<const unsigned char*>(bytes.data()),
                 bytes.size());
    jpeg_save_markers(&cinfo, kICCMarker, 0xFFFF);
    jpeg_save_markers(&cinfo, kExifMarker, 0xFFFF);
    jpeg_read_header(&cinfo, TRUE);
    nbcomp = cinfo.num_components;
    if (nbcomp != 1 && nbcomp != 3 && nbcomp != 4) {
      jpeg_abort_decompress(&cinfo);
      jpeg_destroy_decompress(&cinfo);
      return false;
    }
    if (!ReadICCProfile(&cinfo, &icc)) {
      // A broken profile is treated as sRGB.
      icc_error = true;
      icc.clear();
    }
    ReadExif(&cinfo, &exif);
    if (nbcomp == 4) {
      cinfo.out_color_space = JCS_CMYK;
      inverted_cmyk = cinfo.saw_Adobe_marker;
    } else if (nbcomp == 1) {
      cinfo.out_color_space = JCS_GRAYSCALE;
    } else {
      cinfo.out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&cinfo);
    PIO_ASSERT(cinfo.output_components == nbcomp);
    xsize = cinfo.output_width;
    ysize = cinfo.output_height;
    // CMYK keeps its 4 samples until the color conversion below.
    const size_t out_channels = nbcomp == 4 ? 4 : 3;
    pixels.resize(xsize * ysize * out_channels);
    row.reset(new JSAMPLE[cinfo.output_components * xsize]);
    for (size_t y = 0; y < ysize; ++y) {
      JSAMPROW rows[] = {row.get()};
      jpeg_read_scanlines(&cinfo, rows, 1);
      uint8_t* out = pixels.data() + y * xsize * out_channels;
      if (nbcomp == 1) {
        for (size_t x = 0; x < xsize; ++x) {
          out[3 * x] = out[3 * x + 1] = out[3 * x + 2] = row[x];
        }
      } else {
        memcpy(out, row.get(), xsize * out_channels);
      }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
  };

  if (!try_catch_block()) {
    return PIO_STATUS(StatusCode::kDecodeError, "failed to decode JPEG");
  }
  if (icc_error) PIO_WARNING("Ignoring corrupted JPEG ICC profile");

  if (nbcomp == 4) {
    StatusOr<PackedImage> image =
        ConvertCmykToSrgb(icc, pixels.data(), xsize, ysize, inverted_cmyk);
    if (!image.ok()) {
      return PIO_STATUS(StatusCode::kDecodeError,
                        "unsupported CMYK JPEG color profile");
    }
    file->image = std::move(image).value_();
    file->icc.clear();
  } else {
    PIO_ASSIGN_OR_RETURN(
        file->image, PackedImage::FromPixels(xsize, ysize, 3, std::move(pixels)));
    file->icc = std::move(icc);
  }
  file->exif = std::move(exif);
  file->format = Format::kJPEG;
  return true;
}

Status EncodeImageJPG(const PackedImage& image, int quality,
                      const JpegOptions& options,
                      std::vector<uint8_t>* bytes) {
  if (image.HasAlpha()) {
    return PIO_STATUS(StatusCode::kEncodeError, "alpha is not supported");
  }
  if (quality < 0 || quality > 100) {
    return PIO_STATUS(StatusCode::kEncodeError,
                      "please specify a 0-100 JPEG quality, got %d", quality);
  }
  if (image.xsize() == 0 || image.ysize() == 0 ||
      image.xsize() > static_cast<size_t>(JPEG_MAX_DIMENSION) ||
      image.ysize() > static_cast<size_t>(JPEG_MAX_DIMENSION)) {
    return PIO_STATUS(StatusCode::kEncodeError, "invalid JPEG size %zux%zu",
                      image.xsize(), image.ysize());
  }
  const bool is_gray = image.IsGray();

  // Written by libjpeg, declared outside of the setjmp() scope.
  unsigned char* buffer = nullptr;
  unsigned long size = 0;
  std::unique_ptr<JSAMPLE[]> gray_row;

  const auto try_catch_block = [&]() -> bool {
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    jmp_buf env;
    cinfo.err = jpeg_std_error(&jerr);
    jerr.error_exit = &MyErrorExit;
    jerr.output_message = &MyOutputMessage;
    if (setjmp(env)) {
      return false;
    }
    cinfo.client_data = static_cast<void*>(&env);

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = static_cast<JDIMENSION>(image.xsize());
    cinfo.image_height = static_cast<JDIMENSION>(image.ysize());
    if (is_gray) {
      cinfo.input_components = 1;
      cinfo.in_color_space = JCS_GRAYSCALE;
    } else {
      cinfo.input_components = 3;
      cinfo.in_color_space = JCS_RGB;
    }
    jpeg_set_defaults(&cinfo);
    cinfo.optimize_coding = options.optimize_coding ? TRUE : FALSE;
    if (cinfo.input_components == 3) {
      SetChromaSubsampling(options.chroma_subsampling, &cinfo);
    }
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    if (is_gray) gray_row.reset(new JSAMPLE[image.xsize()]);
    for (size_t y = 0; y < image.ysize(); ++y) {
      const uint8_t* in = image.ConstRow(y);
      JSAMPROW rows[1];
      if (is_gray) {
        for (size_t x = 0; x < image.xsize(); ++x) gray_row[x] = in[3 * x + 1];
        rows[0] = gray_row.get();
      } else {
        rows[0] = const_cast<JSAMPROW>(in);
      }
      jpeg_write_scanlines(&cinfo, rows, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
  };

  const bool ok = try_catch_block();
  if (ok) bytes->assign(buffer, buffer + size);
  std::free(buffer);
  if (!ok) {
    return PIO_STATUS(StatusCode::kEncodeError, "libjpeg failed to encode");
  }
  return true;
}

}  // namespace extras
}  // namespace pio
