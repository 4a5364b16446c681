// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_PROGRESS_H_
#define TOOLS_PROGRESS_H_

// Progress lines printed by pio with -v.

#include <stddef.h>

#include <string>

#include "lib/pio/quality_table.h"
#include "lib/pio/trial_scheduler.h"

namespace pio {
namespace tools {

// "size" as a percentage of "reference", 0 for an empty reference.
double Percent(size_t size, size_t reference);

// One line (with the trailing newline) describing a finished trial of the
// band "target". Failed trials name the format and the status code.
std::string TrialLine(const TrialOutcome& outcome, const QualityTarget& target,
                      size_t input_size);

}  // namespace tools
}  // namespace pio

#endif  // TOOLS_PROGRESS_H_
