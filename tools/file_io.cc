// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/file_io.h"

#include <stdio.h>
#include <string.h>

#include <cerrno>
#include <cstdio>
#include <random>
#include <string>

#include "lib/pio/base/status.h"

namespace pio {
namespace tools {

namespace {

bool ReadStream(FILE* file, std::vector<uint8_t>* out) {
  out->clear();
  uint8_t buf[1 << 16];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
    out->insert(out->end(), buf, buf + n);
  }
  return ferror(file) == 0;
}

bool WriteStream(FILE* file, const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) return true;
  return fwrite(bytes.data(), 1, bytes.size(), file) == bytes.size();
}

// Same directory as "filename", so that the rename does not cross file
// systems.
std::string TemporaryName(const std::string& filename) {
  const size_t sep = filename.find_last_of('/');
  const std::string dir =
      sep == std::string::npos ? "" : filename.substr(0, sep + 1);
  std::random_device rd;
  std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
  static const char kHex[] = "0123456789abcdef";
  std::string suffix;
  uint64_t bits = rng();
  for (int i = 0; i < 16; ++i) {
    suffix += kHex[bits & 15];
    bits >>= 4;
  }
  return dir + ".pio-" + suffix + ".tmp";
}

}  // namespace

bool ReadFile(const char* filename, std::vector<uint8_t>* out) {
  if (strcmp(filename, "-") == 0) {
    return ReadStream(stdin, out);
  }
  FILE* file = fopen(filename, "rb");
  if (!file) {
    PIO_DEBUG_V(1, "fopen %s failed: %s", filename, strerror(errno));
    return false;
  }
  const bool ok = ReadStream(file, out);
  if (fclose(file) != 0) return false;
  return ok;
}

bool WriteFile(const char* filename, const std::vector<uint8_t>& bytes) {
  if (strcmp(filename, "-") == 0) {
    return WriteStream(stdout, bytes) && fflush(stdout) == 0;
  }
  const std::string tmp = TemporaryName(filename);
  FILE* file = fopen(tmp.c_str(), "wb");
  if (!file) {
    fprintf(stderr, "Could not open %s for writing: %s\n", tmp.c_str(),
            strerror(errno));
    return false;
  }
  bool ok = WriteStream(file, bytes);
  if (fclose(file) != 0) ok = false;
  if (ok && rename(tmp.c_str(), filename) != 0) {
    fprintf(stderr, "Could not rename %s to %s: %s\n", tmp.c_str(), filename,
            strerror(errno));
    ok = false;
  }
  if (!ok) {
    remove(tmp.c_str());
    fprintf(stderr, "Failed to write %s\n", filename);
  }
  return ok;
}

}  // namespace tools
}  // namespace pio
