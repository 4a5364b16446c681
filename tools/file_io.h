// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_FILE_IO_H_
#define TOOLS_FILE_IO_H_

// Input and output files of the pio tools. "-" names stdin or stdout.

#include <stdint.h>

#include <vector>

namespace pio {
namespace tools {

// Loads the source image file into "out".
bool ReadFile(const char* filename, std::vector<uint8_t>* out);

// Stores the optimized (or copied) image. The bytes go to a hidden
// ".pio-<random>.tmp" file in the destination directory, which is then renamed
// over "filename"; on failure the temporary file is removed and an existing
// output is left untouched.
bool WriteFile(const char* filename, const std::vector<uint8_t>& bytes);

}  // namespace tools
}  // namespace pio

#endif  // TOOLS_FILE_IO_H_
