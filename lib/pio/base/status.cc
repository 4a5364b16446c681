// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/base/status.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

namespace pio {

bool Debug(const char* format, ...) {
  va_list args;
  va_start(args, format);
  vfprintf(stderr, format, args);
  va_end(args);
  return false;
}

bool Abort() {
  fflush(stderr);
  abort();
}

const char* StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "ok";
    case StatusCode::kGenericError:
      return "error";
    case StatusCode::kEncodeError:
      return "encode error";
    case StatusCode::kDecodeError:
      return "decode error";
    case StatusCode::kDimensionMismatch:
      return "dimension mismatch";
    case StatusCode::kNoViableEncoding:
      return "no viable encoding";
  }
  return "unknown";
}

}  // namespace pio
