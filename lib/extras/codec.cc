// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec.h"

#include <algorithm>
#include <cctype>
#include <locale>
#include <utility>

#include "lib/extras/codec_jpg.h"
#include "lib/extras/codec_png.h"
#include "lib/extras/codec_webp.h"
#include "lib/extras/color_management.h"
#include "lib/extras/exif.h"
#include "lib/extras/orientation.h"

namespace pio {
namespace extras {
namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](char c) {
    return std::tolower(c, std::locale::classic());
  });
  return s;
}

std::string GetExtension(const std::string& path) {
  // Pattern: "name.png"
  size_t pos = path.find_last_of('.');
  size_t sep = path.find_last_of("/\\");
  if (pos != std::string::npos && (sep == std::string::npos || pos > sep)) {
    return path.substr(pos + 1);
  }

  // Extension not found
  return "";
}

// Decodes the output of the matching encoder.
StatusOr<PackedImage> DecodeOwnOutput(Format format,
                                      const std::vector<uint8_t>& bytes) {
  DecodedFile file;
  Status status = true;
  switch (format) {
    case Format::kJPEG:
      status = DecodeImageJPG(bytes, &file);
      break;
    case Format::kPNG:
      status = DecodeImagePNG(bytes, &file);
      break;
    case Format::kWebP:
      status = DecodeImageWebP(bytes, &file);
      break;
  }
  if (!status) {
    return PIO_STATUS(StatusCode::kDecodeError, "failed to decode own %s",
                      FormatName(format));
  }
  return std::move(file.image);
}

}  // namespace

bool DetectFormat(const std::vector<uint8_t>& bytes, Format* format) {
  if (IsJPG(bytes.data(), bytes.size())) {
    *format = Format::kJPEG;
  } else if (IsPNG(bytes.data(), bytes.size())) {
    *format = Format::kPNG;
  } else if (IsWebP(bytes.data(), bytes.size())) {
    *format = Format::kWebP;
  } else {
    return false;
  }
  return true;
}

bool FormatFromPath(const std::string& path, Format* format) {
  return ParseFormat(GetExtension(path), format);
}

bool ParseFormat(const std::string& name, Format* format) {
  const std::string lower = ToLower(name);
  if (lower == "jpeg" || lower == "jpg") {
    *format = Format::kJPEG;
  } else if (lower == "png") {
    *format = Format::kPNG;
  } else if (lower == "webp") {
    *format = Format::kWebP;
  } else {
    return false;
  }
  return true;
}

Status ParseFormatList(const std::string& list, std::vector<Format>* formats) {
  formats->clear();
  size_t begin = 0;
  while (begin <= list.size()) {
    size_t end = list.find(',', begin);
    if (end == std::string::npos) end = list.size();
    const std::string name = list.substr(begin, end - begin);
    Format format;
    if (!ParseFormat(name, &format)) {
      return PIO_FAILURE("unknown format \"%s\"", name.c_str());
    }
    if (std::find(formats->begin(), formats->end(), format) ==
        formats->end()) {
      formats->push_back(format);
    }
    begin = end + 1;
  }
  return true;
}

Status DecodeBytes(const std::vector<uint8_t>& bytes, DecodedFile* file) {
  Format format;
  if (!DetectFormat(bytes, &format)) {
    return PIO_STATUS(StatusCode::kDecodeError, "unrecognized image format");
  }
  switch (format) {
    case Format::kJPEG:
      return DecodeImageJPG(bytes, file);
    case Format::kPNG:
      return DecodeImagePNG(bytes, file);
    case Format::kWebP:
      return DecodeImageWebP(bytes, file);
  }
  return PIO_FAILURE("unknown format");
}

StatusOr<PackedImage> DecodeToSrgb(const std::vector<uint8_t>& bytes,
                                   Format* orig_format) {
  DecodedFile file;
  PIO_RETURN_IF_ERROR(DecodeBytes(bytes, &file));
  PIO_ASSIGN_OR_RETURN(PackedImage srgb, ConvertToSrgb(file.icc, file.image));
  const Orientation orientation = InterpretExifOrientation(file.exif);
  if (orig_format) *orig_format = file.format;
  if (orientation == Orientation::kIdentity) return srgb;
  return ApplyOrientation(srgb, orientation);
}

CodecAdapter MakeCodecAdapter(Format format, const OptimizeParams& params) {
  CodecAdapter adapter;
  adapter.format = format;
  adapter.native_range = NativeRange(format);
  switch (format) {
    case Format::kJPEG: {
      const JpegOptions options = params.jpeg;
      adapter.encode = [options](const PackedImage& image, int parameter,
                                 std::vector<uint8_t>* bytes) {
        return EncodeImageJPG(image, parameter, options, bytes);
      };
      break;
    }
    case Format::kPNG: {
      const PngOptions options = params.png;
      adapter.encode = [options](const PackedImage& image, int parameter,
                                 std::vector<uint8_t>* bytes) {
        return EncodeImagePNG(image, parameter, options, bytes);
      };
      break;
    }
    case Format::kWebP: {
      const WebPOptions options = params.webp;
      adapter.encode = [options](const PackedImage& image, int parameter,
                                 std::vector<uint8_t>* bytes) {
        return EncodeImageWebP(image, parameter, options, bytes);
      };
      break;
    }
  }
  adapter.decode = [format](const std::vector<uint8_t>& bytes) {
    return DecodeOwnOutput(format, bytes);
  };
  return adapter;
}

std::vector<CodecAdapter> MakeCodecAdapters(const OptimizeParams& params) {
  std::vector<CodecAdapter> adapters;
  adapters.reserve(params.formats.size());
  for (Format format : params.formats) {
    adapters.push_back(MakeCodecAdapter(format, params));
  }
  return adapters;
}

}  // namespace extras
}  // namespace pio
