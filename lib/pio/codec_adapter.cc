// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/codec_adapter.h"

namespace pio {

const char* FormatName(Format format) {
  switch (format) {
    case Format::kJPEG:
      return "jpeg";
    case Format::kPNG:
      return "png";
    case Format::kWebP:
      return "webp";
  }
  return "unknown";
}

bool FormatSupportsAlpha(Format format) {
  switch (format) {
    case Format::kJPEG:
      return false;
    case Format::kPNG:
    case Format::kWebP:
      return true;
  }
  return false;
}

ParamRange NativeRange(Format format) {
  switch (format) {
    case Format::kJPEG:
    case Format::kWebP:
      return ParamRange{0, 100};
    case Format::kPNG:
      return ParamRange{2, 256};
  }
  return ParamRange{0, 100};
}

}  // namespace pio
