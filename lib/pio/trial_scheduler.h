// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_TRIAL_SCHEDULER_H_
#define LIB_PIO_TRIAL_SCHEDULER_H_

// Runs batches of independent trials on a thread pool and collects their
// outcomes in request order.

#include <vector>

#include "lib/pio/base/data_parallel.h"
#include "lib/pio/base/status.h"
#include "lib/pio/codec_adapter.h"
#include "lib/pio/evaluator.h"
#include "lib/pio/packed_image.h"
#include "lib/pio/trial.h"

namespace pio {

// Everything one trial reads. The pointers are borrowed and must outlive the
// batch; all of them are only read during the batch.
struct TrialRequest {
  const CodecAdapter* adapter;
  const PackedImage* image;
  const Evaluator* evaluator;
  int parameter;
};

struct TrialOutcome {
  // kEncodeError if the encoder rejected the request, kDecodeError if its
  // output could not be decoded, kDimensionMismatch if the decoded image does
  // not match the source.
  Status status = true;
  // Valid only if "status" is ok.
  Trial trial;
};

class TrialScheduler {
 public:
  // "pool" may be null, in which case trials run on the calling thread.
  explicit TrialScheduler(ThreadPool* pool) : pool_(pool) {}

  // Runs every request and stores one outcome per request, in the same order,
  // in "outcomes". Returns after every trial finished. Failed trials are
  // reported in their outcome; the returned status only fails if the pool
  // itself failed.
  Status RunBatch(const std::vector<TrialRequest>& requests,
                  std::vector<TrialOutcome>* outcomes);

  // Single trial on the calling thread.
  static TrialOutcome RunTrial(const TrialRequest& request);

 private:
  ThreadPool* pool_;
};

}  // namespace pio

#endif  // LIB_PIO_TRIAL_SCHEDULER_H_
