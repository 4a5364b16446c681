// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/exif.h"

#include <cstring>

namespace pio {
namespace extras {
namespace {

constexpr uint8_t kExifIdentifier[6] = {'E', 'x', 'i', 'f', 0, 0};

uint16_t Load16(bool bigendian, const uint8_t* p) {
  return bigendian ? static_cast<uint16_t>((p[0] << 8) | p[1])
                   : static_cast<uint16_t>((p[1] << 8) | p[0]);
}

uint32_t Load32(bool bigendian, const uint8_t* p) {
  if (bigendian) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
  }
  return (static_cast<uint32_t>(p[3]) << 24) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[1]) << 8) | p[0];
}

}  // namespace

std::vector<uint8_t> StripExifIdentifier(const uint8_t* data, size_t size) {
  if (size >= sizeof(kExifIdentifier) &&
      memcmp(data, kExifIdentifier, sizeof(kExifIdentifier)) == 0) {
    return std::vector<uint8_t>(data + sizeof(kExifIdentifier), data + size);
  }
  return std::vector<uint8_t>(data, data + size);
}

Orientation InterpretExifOrientation(const std::vector<uint8_t>& exif) {
  // Byte order mark, magic number and IFD0 offset.
  if (exif.size() < 8) return Orientation::kIdentity;
  const uint8_t* t = exif.data();
  bool bigendian;
  if (t[0] == 'M' && t[1] == 'M' && t[2] == 0 && t[3] == 42) {
    bigendian = true;
  } else if (t[0] == 'I' && t[1] == 'I' && t[2] == 42 && t[3] == 0) {
    bigendian = false;
  } else {
    return Orientation::kIdentity;
  }
  const uint32_t offset = Load32(bigendian, t + 4);
  if (offset < 8 || offset > exif.size() - 2) return Orientation::kIdentity;
  size_t pos = offset;
  uint16_t nb_tags = Load16(bigendian, t + pos);
  pos += 2;
  // Every IFD entry is 12 bytes: tag, type, count and value.
  for (; nb_tags > 0 && pos + 12 <= exif.size(); --nb_tags, pos += 12) {
    const uint16_t tag = Load16(bigendian, t + pos);
    if (tag != kExifOrientationTag) continue;
    const uint16_t type = Load16(bigendian, t + pos + 2);
    const uint32_t count = Load32(bigendian, t + pos + 4);
    const uint16_t value = Load16(bigendian, t + pos + 8);
    // SHORT
    if (type == 3 && count == 1 && value >= 1 && value <= 8) {
      return static_cast<Orientation>(value);
    }
    return Orientation::kIdentity;
  }
  return Orientation::kIdentity;
}

}  // namespace extras
}  // namespace pio
