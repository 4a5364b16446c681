// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_ARGS_H_
#define TOOLS_ARGS_H_

// Helpers for parsing command line arguments.

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include "lib/extras/codec.h"
#include "lib/pio/alpha.h"
#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/optimize_params.h"

namespace pio {
namespace tools {

static inline bool ParseUnsigned(const char* arg, size_t* out) {
  char* end;
  *out = static_cast<size_t>(strtoull(arg, &end, 0));
  if (end[0] != '\0' || arg[0] == '-') {
    fprintf(stderr, "Unable to interpret as unsigned integer: %s.\n", arg);
    return PIO_FAILURE("Args");
  }
  return true;
}

static inline bool ParseSigned(const char* arg, int32_t* out) {
  char* end;
  *out = static_cast<int32_t>(strtol(arg, &end, 0));
  if (end[0] != '\0') {
    fprintf(stderr, "Unable to interpret as signed integer: %s.\n", arg);
    return PIO_FAILURE("Args");
  }
  return true;
}

static inline bool ParseDouble(const char* arg, double* out) {
  char* end;
  *out = static_cast<double>(strtod(arg, &end));
  if (end[0] != '\0') {
    fprintf(stderr, "Unable to interpret as double: %s.\n", arg);
    return PIO_FAILURE("Args");
  }
  return true;
}

static inline bool ParseString(const char* arg, std::string* out) {
  out->assign(arg);
  return true;
}

static inline bool ParseCString(const char* arg, const char** out) {
  *out = arg;
  return true;
}

static inline bool SetBooleanTrue(bool* out) {
  *out = true;
  return true;
}

static inline bool SetBooleanFalse(bool* out) {
  *out = false;
  return true;
}

static inline bool IncrementUnsigned(size_t* out) {
  (*out)++;
  return true;
}

// "420", "422" or "444".
static inline bool ParseChromaSubsampling(const char* arg,
                                          ChromaSubsampling* out) {
  const std::string s_arg(arg);
  if (s_arg == "420") {
    *out = ChromaSubsampling::k420;
    return true;
  }
  if (s_arg == "422") {
    *out = ChromaSubsampling::k422;
    return true;
  }
  if (s_arg == "444") {
    *out = ChromaSubsampling::k444;
    return true;
  }
  fprintf(stderr, "Invalid flag, %s must be 420, 422 or 444\n", arg);
  return PIO_FAILURE("Args");
}

// "RRGGBB" in hexadecimal, optionally with a leading '#'.
static inline bool ParseBackground(const char* arg, BackgroundColor* out) {
  if (!ParseBackgroundColor(arg, out)) {
    fprintf(stderr, "Unable to interpret as RRGGBB color: %s.\n", arg);
    return PIO_FAILURE("Args");
  }
  return true;
}

// Comma separated list such as "webp,jpeg".
static inline bool ParseFormats(const char* arg, std::vector<Format>* out) {
  if (!extras::ParseFormatList(arg, out)) {
    fprintf(stderr,
            "Unable to interpret as a list of jpeg, png and webp: %s.\n", arg);
    return PIO_FAILURE("Args");
  }
  return true;
}

}  // namespace tools
}  // namespace pio

#endif  // TOOLS_ARGS_H_
