// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/pio/srgb.h"

#include <array>
#include <cmath>

namespace pio {
namespace {

// Decoded once for all 256 sample values.
class LinearTable {
 public:
  LinearTable() {
    for (int i = 0; i < 256; ++i) {
      const double v = i / 255.0;
      table_[i] = static_cast<float>(
          v <= 0.04045 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4));
    }
  }
  float operator[](uint8_t v) const { return table_[v]; }

 private:
  std::array<float, 256> table_;
};

const LinearTable& GetLinearTable() {
  static const LinearTable* table = new LinearTable();
  return *table;
}

}  // namespace

float SrgbToLinear(uint8_t v) { return GetLinearTable()[v]; }

uint8_t LinearToSrgb8(float linear) {
  if (!(linear > 0.0f)) return 0;
  if (linear >= 1.0f) return 255;
  const double v = linear <= 0.0031308
                       ? linear * 12.92
                       : 1.055 * std::pow(static_cast<double>(linear),
                                          1.0 / 2.4) -
                             0.055;
  return static_cast<uint8_t>(std::lround(v * 255.0));
}

}  // namespace pio
